#include "secret.hpp"
#include <algorithm>
#include <string.h>

// Larger than any small-string buffer, so the bytes always live on the
// heap and moves transfer ownership instead of copying.
static constexpr size_t MIN_SECRET_CAPACITY = 64;

static void wipe(std::string& s) {
    if (s.capacity() > 0) {
        explicit_bzero(&s[0], s.capacity());
    }
}

Secret::Secret() {
    bytes_.reserve(MIN_SECRET_CAPACITY);
}

Secret::Secret(std::string bytes) {
    bytes_.reserve(std::max(MIN_SECRET_CAPACITY, bytes.size()));
    bytes_.assign(bytes);
    wipe(bytes);
}

Secret::~Secret() {
    clear();
}

Secret::Secret(Secret&& other) noexcept {
    bytes_.swap(other.bytes_);
}

Secret& Secret::operator=(Secret&& other) noexcept {
    if (this != &other) {
        clear();
        bytes_.swap(other.bytes_);
    }
    return *this;
}

void Secret::append(const char* data, size_t len) {
    if (bytes_.size() + len > bytes_.capacity()) {
        std::string grown;
        grown.reserve(std::max({MIN_SECRET_CAPACITY, bytes_.capacity() * 2, bytes_.size() + len}));
        grown.assign(bytes_);
        wipe(bytes_);
        bytes_.swap(grown);
    }
    bytes_.append(data, len);
}

void Secret::strip_newline() {
    if (!bytes_.empty() && bytes_.back() == '\n') {
        bytes_[bytes_.size() - 1] = '\0';
        bytes_.pop_back();
        if (!bytes_.empty() && bytes_.back() == '\r') {
            bytes_[bytes_.size() - 1] = '\0';
            bytes_.pop_back();
        }
    }
}

void Secret::clear() {
    wipe(bytes_);
    bytes_.clear();
}
