#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include <zlib.h>

namespace fastaio {

enum class WriteMode { kTruncate, kAppend };

// Byte-level stream consumed by FastaReader and fed by FastaWriter.
// Implementations report failures by throwing FastaError.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to n bytes into buf. Returns 0 at end of stream.
    virtual size_t read(void* buf, size_t n) = 0;

    // Write exactly n bytes. Throws kEndOfFile once the stream is closed.
    virtual void write(const void* data, size_t n) = 0;

    void put(char c) { write(&c, 1); }

    virtual void seek(uint64_t offset) = 0;
    virtual void flush() = 0;
    virtual void close() = 0;

    virtual std::string name() const = 0;
};

// zlib-backed file stream. Reading accepts gzip or plain files
// transparently; writing compresses only when `compress` is set.
class GzFileStream : public ByteStream {
public:
    // Open for reading.
    explicit GzFileStream(const std::string& path);

    // Open for writing.
    GzFileStream(const std::string& path, WriteMode mode, bool compress);

    ~GzFileStream() override;

    GzFileStream(const GzFileStream&) = delete;
    GzFileStream& operator=(const GzFileStream&) = delete;

    size_t read(void* buf, size_t n) override;
    void write(const void* data, size_t n) override;
    void seek(uint64_t offset) override;
    void flush() override;
    void close() override;

    std::string name() const override { return path_; }

    bool is_open() const { return fp_ != nullptr; }

private:
    std::string path_;
    gzFile fp_ = nullptr;
    bool writing_ = false;

    std::string zerror() const;
};

// Adapter over a caller-owned iostream. close() flushes but never closes
// the wrapped stream.
class StdStreamAdapter : public ByteStream {
public:
    StdStreamAdapter(std::istream& in, std::string name = "<istream>");
    StdStreamAdapter(std::ostream& out, std::string name = "<ostream>");

    size_t read(void* buf, size_t n) override;
    void write(const void* data, size_t n) override;

    // Seeking a stream that cannot seek succeeds only while nothing has
    // been consumed, so a fresh pipe can still be read from the start.
    void seek(uint64_t offset) override;
    void flush() override;
    void close() override;

    std::string name() const override { return name_; }

private:
    std::istream* in_ = nullptr;
    std::ostream* out_ = nullptr;
    std::string name_;
    uint64_t consumed_ = 0;
    bool closed_ = false;
};

// "-" selects stdin; anything else is opened as a (possibly gzipped) file.
std::unique_ptr<ByteStream> open_input_stream(const std::string& path);

// "-" selects stdout; a ".gz" suffix selects gzip compression.
std::unique_ptr<ByteStream> open_output_stream(const std::string& path,
                                               WriteMode mode = WriteMode::kTruncate);

bool has_gz_suffix(const std::string& path);

} // namespace fastaio
