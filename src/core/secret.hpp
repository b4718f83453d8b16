#pragma once

#include <string>
#include <cstddef>

// Opaque secret bytes. Move-only, never formatted or streamed, and wiped
// from memory on destruction. Growth reallocates by hand so that no
// unwiped copy is left behind in freed heap blocks.
class Secret {
public:
    Secret();
    explicit Secret(std::string bytes);
    ~Secret();

    Secret(Secret&& other) noexcept;
    Secret& operator=(Secret&& other) noexcept;
    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;

    void append(const char* data, size_t len);

    // Drop one trailing "\n" or "\r\n" (terminal input)
    void strip_newline();

    void clear();

    const char* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

private:
    std::string bytes_;
};
