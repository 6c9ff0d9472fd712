#include "io/byte_stream.hpp"
#include "core/fasta_error.hpp"

#include <cerrno>
#include <cstdio>
#include <climits>
#include <cstring>
#include <iostream>
#include <utility>

namespace fastaio {

GzFileStream::GzFileStream(const std::string& path) : path_(path) {
    errno = 0;
    fp_ = gzopen(path.c_str(), "rb");
    if (!fp_) {
        throw FastaError(FastaErrc::kOpenFailure,
                         "cannot open '" + path + "' for reading: " +
                         (errno ? std::strerror(errno) : "out of memory"));
    }
}

GzFileStream::GzFileStream(const std::string& path, WriteMode mode, bool compress)
    : path_(path), writing_(true) {
    // "T" asks zlib for transparent (uncompressed) output.
    std::string zmode = (mode == WriteMode::kAppend) ? "ab" : "wb";
    if (!compress) zmode += 'T';

    errno = 0;
    fp_ = gzopen(path.c_str(), zmode.c_str());
    if (!fp_) {
        throw FastaError(FastaErrc::kOpenFailure,
                         "cannot open '" + path + "' for writing: " +
                         (errno ? std::strerror(errno) : "out of memory"));
    }
}

GzFileStream::~GzFileStream() {
    if (fp_) {
        gzclose(fp_);
        fp_ = nullptr;
    }
}

std::string GzFileStream::zerror() const {
    int errnum = 0;
    const char* msg = fp_ ? gzerror(fp_, &errnum) : "stream closed";
    if (errnum == Z_ERRNO) return std::strerror(errno);
    return msg ? msg : "unknown zlib error";
}

size_t GzFileStream::read(void* buf, size_t n) {
    if (!fp_ || writing_) {
        throw FastaError(FastaErrc::kReadFailure,
                         "read failure on '" + path_ + "': stream not open for reading");
    }
    if (n > static_cast<size_t>(INT_MAX)) n = static_cast<size_t>(INT_MAX);
    int r = gzread(fp_, buf, static_cast<unsigned>(n));
    if (r < 0) {
        throw FastaError(FastaErrc::kReadFailure,
                         "read failure on '" + path_ + "': " + zerror());
    }
    return static_cast<size_t>(r);
}

void GzFileStream::write(const void* data, size_t n) {
    if (!fp_) {
        throw FastaError(FastaErrc::kEndOfFile,
                         "write to closed stream '" + path_ + "'");
    }
    if (!writing_) {
        throw FastaError(FastaErrc::kWriteFailure,
                         "write failure on '" + path_ + "': stream not open for writing");
    }
    const char* p = static_cast<const char*>(data);
    while (n > 0) {
        unsigned part = n > static_cast<size_t>(INT_MAX)
                            ? static_cast<unsigned>(INT_MAX)
                            : static_cast<unsigned>(n);
        int w = gzwrite(fp_, p, part);
        if (w <= 0) {
            throw FastaError(FastaErrc::kWriteFailure,
                             "write failure on '" + path_ + "': " + zerror());
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
}

void GzFileStream::seek(uint64_t offset) {
    if (!fp_ || writing_) {
        throw FastaError(FastaErrc::kNotSeekable,
                         "cannot seek '" + path_ + "'");
    }
    if (gzseek(fp_, static_cast<z_off_t>(offset), SEEK_SET) < 0) {
        throw FastaError(FastaErrc::kNotSeekable,
                         "cannot seek '" + path_ + "': " + zerror());
    }
}

void GzFileStream::flush() {
    if (!fp_ || !writing_) return;
    if (gzflush(fp_, Z_SYNC_FLUSH) != Z_OK) {
        throw FastaError(FastaErrc::kWriteFailure,
                         "flush failure on '" + path_ + "': " + zerror());
    }
}

void GzFileStream::close() {
    if (!fp_) return;
    int rc = gzclose(fp_);
    fp_ = nullptr;
    if (rc != Z_OK && writing_) {
        throw FastaError(FastaErrc::kWriteFailure,
                         "close failure on '" + path_ + "' (zlib error " +
                         std::to_string(rc) + ")");
    }
}

StdStreamAdapter::StdStreamAdapter(std::istream& in, std::string name)
    : in_(&in), name_(std::move(name)) {}

StdStreamAdapter::StdStreamAdapter(std::ostream& out, std::string name)
    : out_(&out), name_(std::move(name)) {}

size_t StdStreamAdapter::read(void* buf, size_t n) {
    if (!in_ || closed_) {
        throw FastaError(FastaErrc::kReadFailure,
                         "read failure on " + name_ + ": stream not readable");
    }
    in_->read(static_cast<char*>(buf), static_cast<std::streamsize>(n));
    if (in_->bad()) {
        throw FastaError(FastaErrc::kReadFailure, "read failure on " + name_);
    }
    size_t got = static_cast<size_t>(in_->gcount());
    consumed_ += got;
    return got;
}

void StdStreamAdapter::write(const void* data, size_t n) {
    if (closed_) {
        throw FastaError(FastaErrc::kEndOfFile, "write to closed stream " + name_);
    }
    if (!out_) {
        throw FastaError(FastaErrc::kWriteFailure,
                         "write failure on " + name_ + ": stream not writable");
    }
    out_->write(static_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!out_->good()) {
        throw FastaError(FastaErrc::kWriteFailure, "write failure on " + name_);
    }
}

void StdStreamAdapter::seek(uint64_t offset) {
    if (!in_ || closed_) {
        throw FastaError(FastaErrc::kNotSeekable, "cannot seek " + name_);
    }
    in_->clear();
    in_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (in_->fail()) {
        in_->clear();
        if (offset == 0 && consumed_ == 0) return;
        throw FastaError(FastaErrc::kNotSeekable, "cannot seek " + name_);
    }
    consumed_ = offset;
}

void StdStreamAdapter::flush() {
    if (!out_ || closed_) return;
    out_->flush();
    if (out_->bad()) {
        throw FastaError(FastaErrc::kWriteFailure, "flush failure on " + name_);
    }
}

void StdStreamAdapter::close() {
    if (closed_) return;
    closed_ = true;
    if (out_) {
        out_->flush();
        if (out_->bad()) {
            throw FastaError(FastaErrc::kWriteFailure, "flush failure on " + name_);
        }
    }
}

bool has_gz_suffix(const std::string& path) {
    return path.size() >= 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

std::unique_ptr<ByteStream> open_input_stream(const std::string& path) {
    if (path == "-") {
        return std::make_unique<StdStreamAdapter>(std::cin, "<stdin>");
    }
    return std::make_unique<GzFileStream>(path);
}

std::unique_ptr<ByteStream> open_output_stream(const std::string& path, WriteMode mode) {
    if (path == "-") {
        return std::make_unique<StdStreamAdapter>(std::cout, "<stdout>");
    }
    return std::make_unique<GzFileStream>(path, mode, has_gz_suffix(path));
}

} // namespace fastaio
