//
//  transcode.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "transcode.h"

#include "gapit/logging.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace gapit::detail {
namespace {

std::string run_command(const std::string& command, int* status) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        if (status) {
            *status = -1;
        }
        return {};
    }

    std::string output;
    char buffer[4096];
    while (std::fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }

    const int command_status = pclose(pipe);
    if (status) {
        *status = command_status;
    }
    return output;
}

} // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool transcode_to_wav(const std::string& ffmpeg_path,
                      const std::string& input,
                      const std::string& output,
                      int sample_rate,
                      std::string* error) {
    std::ostringstream command;
    command << shell_quote(ffmpeg_path) << " -y -v error -i " << shell_quote(input)
            << " -ar " << sample_rate << " -acodec pcm_s16le " << shell_quote(output)
            << " 2>&1";

    const auto start = std::chrono::steady_clock::now();
    int status = 0;
    const std::string log = run_command(command.str(), &status);
    const auto end = std::chrono::steady_clock::now();

    std::error_code exists_error;
    if (status != 0 || !std::filesystem::exists(output, exists_error)) {
        std::ostringstream message;
        message << "ffmpeg failed to transcode " << input;
        if (status > 0 && WIFEXITED(status)) {
            message << " (exit " << WEXITSTATUS(status) << ")";
        }
        if (!log.empty()) {
            message << ": " << log;
        }
        if (error) {
            *error = message.str();
        }
        GAPIT_LOG_WARN(message.str());
        return false;
    }

    GAPIT_LOG_INFO("Transcoded " << input << " in "
                                 << (std::chrono::duration<double, std::milli>(end - start)).count()
                                 << "ms");
    return true;
}

std::string make_transcode_path(const std::string& input) {
    const std::size_t hash = std::hash<std::string>{}(input);
    std::ostringstream name;
    name << "gapit_" << ::getpid() << "_" << std::hex << hash << ".wav";
    std::error_code temp_error;
    std::filesystem::path directory = std::filesystem::temp_directory_path(temp_error);
    if (temp_error) {
        directory = "/tmp";
    }
    return (directory / name.str()).string();
}

} // namespace gapit::detail
