#include "texture_io.hpp"
#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

std::string slotName(const std::string& name, std::optional<int> frame) {
    if (!frame) return name;
    return name + "_" + std::to_string(*frame);
}

BmpDirectorySink::BmpDirectorySink(std::string dir, bool skipExisting)
    : dir_(std::move(dir)), skipExisting_(skipExisting) {}

std::string BmpDirectorySink::pathFor(const std::string& slot) const {
    const std::string file = slot + ".bmp";
    if (dir_.empty()) return fs::path(file).string();
    return (fs::path(dir_) / file).string();
}

bool BmpDirectorySink::store(const std::string& name, std::optional<int> frame, const Bitmap& bmp) {
    lastError_.clear();
    lastSkipped_ = false;
    lastPath_ = pathFor(slotName(name, frame));

    if (skipExisting_) {
        std::error_code ec;
        if (fs::exists(fs::path(lastPath_), ec)) {
            lastSkipped_ = true;
            ++skipped_;
            return true;
        }
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, Bitmap::w, Bitmap::h, 24, SDL_PIXELFORMAT_RGB24);
    if (!surface) {
        lastError_ = std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError();
        return false;
    }

    // RGB24 is byte-ordered R, G, B in memory regardless of endianness.
    auto* bytes = static_cast<uint8_t*>(surface->pixels);
    for (int y = 0; y < Bitmap::h; ++y) {
        uint8_t* row = bytes + static_cast<size_t>(y) * static_cast<size_t>(surface->pitch);
        for (int x = 0; x < Bitmap::w; ++x) {
            const Color& c = bmp.at(x, y);
            row[x * 3 + 0] = c.r;
            row[x * 3 + 1] = c.g;
            row[x * 3 + 2] = c.b;
        }
    }

    if (SDL_SaveBMP(surface, lastPath_.c_str()) != 0) {
        lastError_ = "could not write " + lastPath_ + ": " + SDL_GetError();
        SDL_FreeSurface(surface);
        return false;
    }

    SDL_FreeSurface(surface);
    ++written_;
    return true;
}

bool ensureOutputDir(const std::string& dir, std::string* err) {
    if (dir.empty()) return true;

    std::error_code ec;
    fs::create_directories(fs::path(dir), ec);
    if (ec) {
        if (err) *err = "could not create " + dir + ": " + ec.message();
        return false;
    }
    if (!fs::is_directory(fs::path(dir), ec)) {
        if (err) *err = dir + " exists but is not a directory";
        return false;
    }
    return true;
}

bool initImaging(std::string* err) {
    SDL_SetMainReady();
    // No subsystems are needed for surfaces and BMP I/O.
    if (SDL_Init(0) != 0) {
        if (err) *err = std::string("SDL_Init failed: ") + SDL_GetError();
        return false;
    }
    return true;
}

void shutdownImaging() {
    SDL_Quit();
}

bool loadBitmap(const std::string& path, Bitmap& out, std::string* err) {
    SDL_Surface* loaded = SDL_LoadBMP(path.c_str());
    if (!loaded) {
        if (err) *err = "could not read " + path + ": " + SDL_GetError();
        return false;
    }

    SDL_Surface* rgb = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGB24, 0);
    SDL_FreeSurface(loaded);
    if (!rgb) {
        if (err) *err = std::string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError();
        return false;
    }

    if (rgb->w != Bitmap::w || rgb->h != Bitmap::h) {
        if (err) {
            *err = path + ": expected " + std::to_string(Bitmap::w) + "x" + std::to_string(Bitmap::h) +
                   ", got " + std::to_string(rgb->w) + "x" + std::to_string(rgb->h);
        }
        SDL_FreeSurface(rgb);
        return false;
    }

    Bitmap bmp;
    const auto* bytes = static_cast<const uint8_t*>(rgb->pixels);
    for (int y = 0; y < Bitmap::h; ++y) {
        const uint8_t* row = bytes + static_cast<size_t>(y) * static_cast<size_t>(rgb->pitch);
        for (int x = 0; x < Bitmap::w; ++x) {
            bmp.set(x, y, { row[x * 3 + 0], row[x * 3 + 1], row[x * 3 + 2] });
        }
    }
    SDL_FreeSurface(rgb);

    out = std::move(bmp);
    return true;
}
