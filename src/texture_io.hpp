#pragma once
#include "texture.hpp"
#include <optional>
#include <string>

// "water" + 2 -> "water_2"; no frame -> "water".
std::string slotName(const std::string& name, std::optional<int> frame);

// Destination for generated frames.
class TextureSink {
public:
    virtual ~TextureSink() = default;

    // Persists one frame. Returns false on failure; the caller decides
    // whether to stop (the batch driver does, without retrying).
    virtual bool store(const std::string& name, std::optional<int> frame, const Bitmap& bmp) = 0;

    virtual const std::string& lastError() const = 0;
};

// Writes <dir>/<slot>.bmp as uncompressed 24-bit RGB via SDL.
class BmpDirectorySink : public TextureSink {
public:
    explicit BmpDirectorySink(std::string dir, bool skipExisting = false);

    bool store(const std::string& name, std::optional<int> frame, const Bitmap& bmp) override;
    const std::string& lastError() const override { return lastError_; }

    std::string pathFor(const std::string& slot) const;

    // Path of the most recent store() attempt.
    const std::string& lastPath() const { return lastPath_; }
    // True when the most recent store() left an existing file alone.
    bool lastSkipped() const { return lastSkipped_; }

    int written() const { return written_; }
    int skipped() const { return skipped_; }

private:
    std::string dir_;
    bool skipExisting_ = false;
    std::string lastError_;
    std::string lastPath_;
    bool lastSkipped_ = false;
    int written_ = 0;
    int skipped_ = 0;
};

// Creates the destination directory (and parents). Must succeed before the
// first store() of a batch.
bool ensureOutputDir(const std::string& dir, std::string* err);

// Brings up / tears down the SDL imaging layer. initImaging() failing is
// fatal for a run.
bool initImaging(std::string* err);
void shutdownImaging();

// Reads a 16x16 BMP back into a Bitmap (any BMP pixel format SDL accepts).
bool loadBitmap(const std::string& path, Bitmap& out, std::string* err);
