#pragma once

#include "transport/stream.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace toolmesh::test_support {

// Serves reads from a fixed buffer and records every byte handed out.
class MemoryStream : public IStream {
public:
    explicit MemoryStream(std::string input = {}) : input_(std::move(input)) {}

    ReadStatus ReadExact(std::size_t n, std::string* out, std::string* err) override {
        (void)err;
        out->clear();
        const std::size_t available = input_.size() - pos_;
        const std::size_t take = std::min(n, available);
        out->assign(input_, pos_, take);
        pos_ += take;
        if (take == n) return ReadStatus::kOk;
        return take == 0 ? ReadStatus::kEof : ReadStatus::kTruncated;
    }

    bool WriteAll(const std::string& data, std::string* err) override {
        if (closed_) {
            if (err) *err = "closed";
            return false;
        }
        output_ += data;
        return true;
    }

    void Close() override { closed_ = true; }

    std::size_t consumed() const { return pos_; }
    const std::string& output() const { return output_; }

private:
    std::string input_;
    std::size_t pos_ = 0;
    std::string output_;
    bool closed_ = false;
};

}  // namespace toolmesh::test_support
