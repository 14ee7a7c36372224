#include "process.h"
#include "logger.h"
#include <array>
#include <cstdlib>
#include <sys/wait.h>

namespace taco {

namespace {

int decode_status(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

Result<std::string> run_capture(const std::string& command) {
    LOG_DEBUG("exec: " + command);
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return make_process_error("Failed to start: " + command);
    }

    std::string output;
    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }

    int code = decode_status(pclose(pipe));
    if (code != 0) {
        return make_process_error("Command exited with code " + std::to_string(code));
    }
    return output;
}

int run_command(const std::string& command) {
    LOG_DEBUG("exec: " + command);
    return decode_status(std::system(command.c_str()));
}

PipeReader::~PipeReader() {
    close();
}

bool PipeReader::open(const std::string& command) {
    close();
    LOG_DEBUG("pipe: " + command);
    pipe_ = popen(command.c_str(), "r");
    return pipe_ != nullptr;
}

size_t PipeReader::read(void* buffer, size_t size) {
    if (!pipe_) return 0;
    return fread(buffer, 1, size, pipe_);
}

int PipeReader::close() {
    if (!pipe_) return -1;
    int code = decode_status(pclose(pipe_));
    pipe_ = nullptr;
    return code;
}

} // namespace taco
