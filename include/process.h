#pragma once

/**
 * @file process.h
 * @brief Thin helpers around popen()/system() for the external media tools
 */

#include "errors.h"
#include <cstdio>
#include <string>

namespace taco {

/**
 * @brief Run a shell command and capture its stdout
 * @return stdout on exit status 0, ProcessError otherwise (message carries the exit code)
 */
Result<std::string> run_capture(const std::string& command);

/**
 * @brief Run a shell command, discarding output
 * @return Exit status (-1 if the shell could not be started)
 */
int run_command(const std::string& command);

/**
 * @brief Streams the stdout of a child process (popen "r")
 *
 * Used by the playback worker to pull decoded PCM from ffmpeg in chunks.
 * close() is safe to call more than once; the destructor closes the pipe.
 */
class PipeReader {
public:
    PipeReader() = default;
    ~PipeReader();

    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;

    bool open(const std::string& command);

    /**
     * @brief Read up to size bytes (blocking)
     * @return Bytes read; 0 at end of stream or on error
     */
    size_t read(void* buffer, size_t size);

    /**
     * @brief Close the pipe and reap the child
     * @return Exit status of the child (-1 if not open)
     */
    int close();

    bool is_open() const { return pipe_ != nullptr; }

private:
    FILE* pipe_ = nullptr;
};

} // namespace taco
