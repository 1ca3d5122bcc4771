#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ShellUtils.hpp"
#include <SDL.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace bidlens::infrastructure {

bool AudioUtils::ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error) {
    namespace fs = std::filesystem;
    outputPath = ShellUtils::UniqueTempPath("_" + fs::path(inputPath).stem().string() + ".wav");

    const std::string cmd = "ffmpeg -y -loglevel error -i " + ShellUtils::Quote(inputPath) +
                            " -ar 16000 -ac 1 -c:a pcm_s16le " + ShellUtils::Quote(outputPath);
    if (ShellUtils::Run(cmd) != 0) {
        error = "ffmpeg conversion failed. Is ffmpeg installed?";
        return false;
    }

    std::error_code ec;
    if (!fs::exists(outputPath, ec)) {
        error = "Converted file not found: " + outputPath;
        return false;
    }
    return true;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8* wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          AUDIO_F32SYS, 1, kSampleRate) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = static_cast<int>(wavLength);
    cvt.buf = static_cast<Uint8*>(SDL_malloc(static_cast<size_t>(cvt.len) * cvt.len_mult));
    if (!cvt.buf) {
        error = "Out of memory converting " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    pcmf32.resize(cvt.len_cvt / sizeof(float));
    SDL_memcpy(pcmf32.data(), cvt.buf, pcmf32.size() * sizeof(float));

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);
    return true;
}

bool AudioUtils::LoadAudioFile(const std::string& path, std::vector<float>& pcmf32, std::string& error) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        error = "Audio file not found: " + path;
        return false;
    }

    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (ext == ".wav") {
        return LoadAudioSDL(path, pcmf32, error);
    }

    std::string wavPath;
    if (!ConvertAudioToWav(path, wavPath, error)) return false;
    bool ok = LoadAudioSDL(wavPath, pcmf32, error);
    fs::remove(wavPath, ec);
    return ok;
}

} // namespace bidlens::infrastructure
