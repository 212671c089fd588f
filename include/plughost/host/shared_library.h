#pragma once

#include <filesystem>
#include <string>
#include <plughost/core/types.h>

namespace plughost::host {

// RAII owner of a dlopen handle. Move-only; dlclose on destruction.
class SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /**
     * Bind the library at `file` with immediate symbol resolution and local visibility.
     * @return BindFailed with the loader diagnostic on failure
     */
    static Result<SharedLibrary> open(const std::filesystem::path& file);

    // Address of `name`, or nullptr when the library does not export it
    void* rawSymbol(const char* name) const;

    template <class T> T symbol(const char* name) const {
        return reinterpret_cast<T>(rawSymbol(name));
    }

    bool isOpen() const { return handle_ != nullptr; }

    // Unbind now; returns the loader diagnostic when dlclose fails
    Result<void> close();

private:
    explicit SharedLibrary(void* handle) : handle_(handle) {}

    void* handle_{nullptr};
};

} // namespace plughost::host
