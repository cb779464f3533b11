//
//  sndfile_loader.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/audio_loader.h"

#include "audio/transcode.h"
#include "gapit/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <utility>
#include <vector>

#include <sndfile.hh>

namespace gapit {
namespace {

constexpr int kTranscodeSampleRate = 44100;

std::string lowercase_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

class SndfileAudioLoader final : public AudioChunkLoader {
public:
    explicit SndfileAudioLoader(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path)) {}

    ~SndfileAudioLoader() override {
        for (const auto& entry : transcoded_) {
            std::error_code ec;
            std::filesystem::remove(entry.second, ec);
            if (ec) {
                GAPIT_LOG_WARN("Sndfile loader: could not remove " << entry.second << ": "
                                                                   << ec.message());
            }
        }
    }

    bool probe(const std::string& path, AudioInfo* info, std::string* error) override {
        std::string readable;
        if (!resolve(path, &readable, error)) {
            return false;
        }
        SndfileHandle file(readable);
        if (!file || file.error() != SF_ERR_NO_ERROR) {
            return fail("cannot open " + path + ": " + file.strError(), error);
        }
        if (info) {
            info->sample_rate = static_cast<double>(file.samplerate());
            info->channels = static_cast<std::size_t>(file.channels());
            info->frames = static_cast<unsigned long long>(file.frames());
        }
        GAPIT_LOG_DEBUG("Sndfile loader: " << path << " sr=" << file.samplerate()
                                           << " channels=" << file.channels()
                                           << " frames=" << file.frames());
        return true;
    }

    bool load(const std::string& path,
              unsigned long long start_frame,
              unsigned long long frame_count,
              Waveform* waveform,
              double* sample_rate,
              std::string* error) override {
        if (!waveform) {
            return fail("missing output waveform", error);
        }
        std::string readable;
        if (!resolve(path, &readable, error)) {
            return false;
        }
        SndfileHandle file(readable);
        if (!file || file.error() != SF_ERR_NO_ERROR) {
            return fail("cannot open " + path + ": " + file.strError(), error);
        }

        const auto total = static_cast<unsigned long long>(file.frames());
        if (start_frame >= total) {
            return fail("start frame beyond end of " + path, error);
        }
        if (file.seek(static_cast<sf_count_t>(start_frame), SEEK_SET) < 0) {
            return fail("seek failed in " + path, error);
        }

        const std::size_t channels = static_cast<std::size_t>(std::max(1, file.channels()));
        const auto wanted = static_cast<std::size_t>(std::min(frame_count, total - start_frame));
        std::vector<float> interleaved(wanted * channels, 0.0f);
        const sf_count_t read = file.readf(interleaved.data(), static_cast<sf_count_t>(wanted));
        if (read <= 0) {
            return fail("no frames decoded from " + path, error);
        }

        const auto frames = static_cast<std::size_t>(read);
        waveform->channels.assign(channels, std::vector<float>(frames, 0.0f));
        for (std::size_t i = 0; i < frames; ++i) {
            for (std::size_t c = 0; c < channels; ++c) {
                waveform->channels[c][i] = interleaved[i * channels + c];
            }
        }
        if (sample_rate) {
            *sample_rate = static_cast<double>(file.samplerate());
        }
        return true;
    }

private:
    static bool fail(const std::string& message, std::string* error) {
        if (error) {
            *error = message;
        }
        GAPIT_LOG_WARN("Sndfile loader: " << message);
        return false;
    }

    // Maps `path` to a file libsndfile can read, transcoding once per source.
    bool resolve(const std::string& path, std::string* readable, std::string* error) {
        const auto cached = transcoded_.find(path);
        if (cached != transcoded_.end()) {
            *readable = cached->second;
            return true;
        }

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return fail("file not found: " + path, error);
        }

        bool transcode = requires_transcoding(path);
        if (!transcode) {
            SndfileHandle file(path);
            transcode = !file || file.error() != SF_ERR_NO_ERROR;
            if (transcode) {
                GAPIT_LOG_DEBUG("Sndfile loader: libsndfile rejected " << path
                                                                       << ", trying ffmpeg.");
            }
        }
        if (!transcode) {
            *readable = path;
            return true;
        }

        const std::string target = detail::make_transcode_path(path);
        if (!detail::transcode_to_wav(ffmpeg_path_, path, target, kTranscodeSampleRate, error)) {
            return false;
        }
        transcoded_[path] = target;
        *readable = target;
        return true;
    }

    std::string ffmpeg_path_;
    std::map<std::string, std::string> transcoded_;
};

} // namespace

bool requires_transcoding(const std::string& path) {
    const std::string ext = lowercase_extension(path);
    return ext == ".m4a" || ext == ".aac" || ext == ".opus";
}

std::unique_ptr<AudioChunkLoader> make_sndfile_audio_loader(const ScanConfig& config) {
    return std::make_unique<SndfileAudioLoader>(config.ffmpeg_path);
}

} // namespace gapit
