#pragma once

#include <LogCompat.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <ostream>

// RAII wrapper around FILE*, closed on destruction
struct F {
    using size_type = std::uint64_t;

    enum class Mode : std::int8_t { Read, ReadBinary };

    // Outcome of a file operation; converts to true on success
    struct Result {
        enum class Reason : std::int8_t {
            kNone,
            kHandleNull,
            kIOFailure,
            kShortRead,
        } reason = Reason::kNone;

        operator bool() const { return reason == Reason::kNone; }

        static Result ok() { return {}; }
        static Result error(Reason why) { return {.reason = why}; }
    };

    F() : handle(nullptr, &fclose) {}
    ~F() { (void)close(); }

    F(const F&) = delete;
    F& operator=(const F&) = delete;
    F(F&& other) noexcept = default;
    F& operator=(F&& other) noexcept = default;

    /**
     * @brief Opens `filename`, closing any handle held before.
     *
     * @return kIOFailure if fopen failed.
     */
    [[nodiscard]] Result open(const std::filesystem::path& filename,
                              Mode mode);

    // Moves to an absolute byte offset
    [[nodiscard]] Result seek(size_type offset) const;

    /**
     * @brief Reads exactly `nBytes` bytes into `ptr`.
     *
     * @return kShortRead if the file ends first, kIOFailure on a stream
     * error.
     */
    [[nodiscard]] Result read(void* ptr, std::size_t nBytes) const;

    Result close();

   private:
    std::unique_ptr<FILE, int (*)(FILE*)> handle;

    [[nodiscard]] bool checkOpen() const;
};

inline std::ostream& operator<<(std::ostream& self,
                                const F::Result::Reason& reason) {
    switch (reason) {
        case F::Result::Reason::kNone:
            return self << "kNone";
        case F::Result::Reason::kHandleNull:
            return self << "kHandleNull";
        case F::Result::Reason::kIOFailure:
            return self << "kIOFailure";
        case F::Result::Reason::kShortRead:
            return self << "kShortRead";
    }
    return self;
}

inline bool F::checkOpen() const {
    if (handle == nullptr) {
        LOG(ERROR) << "File handle is null";
        return false;
    }
    return true;
}

inline F::Result F::open(const std::filesystem::path& filename,
                         const Mode mode) {
    if (auto res = close(); !res) {
        return res;
    }
    handle.reset(
        std::fopen(filename.c_str(), mode == Mode::ReadBinary ? "rb" : "r"));
    if (handle == nullptr) {
        PLOG(ERROR) << "Failed to open file: " << filename;
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}

inline F::Result F::seek(size_type offset) const {
    if (!checkOpen()) {
        return Result::error(Result::Reason::kHandleNull);
    }
    if (fseeko(handle.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        PLOG(ERROR) << "Failed to seek to " << offset;
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}

inline F::Result F::read(void* ptr, std::size_t nBytes) const {
    if (!checkOpen()) {
        return Result::error(Result::Reason::kHandleNull);
    }
    if (nBytes == 0 || std::fread(ptr, 1, nBytes, handle.get()) == nBytes) {
        return Result::ok();
    }
    return Result::error(std::ferror(handle.get()) != 0
                             ? Result::Reason::kIOFailure
                             : Result::Reason::kShortRead);
}

inline F::Result F::close() {
    if (handle && fclose(handle.release()) != 0) {
        LOG(ERROR) << "Failed to close file";
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}
