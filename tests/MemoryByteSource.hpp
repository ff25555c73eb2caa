#pragma once

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include <ByteSource.hpp>
#include <string>
#include <utility>

// ByteSource over a string, counts reads
class MemoryByteSource : public ResumableUpload::ByteSource {
   public:
    explicit MemoryByteSource(std::string data, std::string name = "memory.bin")
        : _data(std::move(data)), _name(std::move(name)) {}

    [[nodiscard]] std::filesystem::path path() const override { return _name; }

    absl::StatusOr<std::uint64_t> size() override { return _data.size(); }

    absl::StatusOr<std::string> read(std::uint64_t offset,
                                     std::size_t length) override {
        ++reads;
        if (failReads > 0) {
            --failReads;
            return absl::DataLossError("injected read failure");
        }
        if (offset + length > _data.size()) {
            return absl::DataLossError(absl::StrCat(
                "read past end: ", offset, "+", length, " > ", _data.size()));
        }
        return _data.substr(offset, length);
    }

    [[nodiscard]] const std::string& data() const { return _data; }

    int reads = 0;
    int failReads = 0;

   private:
    std::string _data;
    std::string _name;
};

// Pattern bytes so misplaced chunks are detected
inline std::string makePayload(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 251) & 0xFF);
    }
    return data;
}
