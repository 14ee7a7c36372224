#include "errors.h"

namespace taco {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:            return "none";
        case ErrorType::ConfigError:     return "config";
        case ErrorType::CredentialError: return "credential";
        case ErrorType::ModelError:      return "model";
        case ErrorType::DeviceError:     return "device";
        case ErrorType::NetworkError:    return "network";
        case ErrorType::ProtocolError:   return "protocol";
        case ErrorType::IOError:         return "io";
        case ErrorType::ProcessError:    return "process";
        case ErrorType::InvalidState:    return "invalid_state";
        case ErrorType::Timeout:         return "timeout";
    }
    return "unknown";
}

} // namespace taco
