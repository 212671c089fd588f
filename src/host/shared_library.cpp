#include <plughost/host/shared_library.h>

#include <dlfcn.h>
#include <spdlog/spdlog.h>

namespace plughost::host {

namespace {

std::string lastDlError() {
    const char* err = dlerror();
    return err ? std::string(err) : std::string("unknown");
}

} // namespace

SharedLibrary::~SharedLibrary() {
    if (handle_) {
        if (dlclose(handle_) != 0)
            spdlog::warn("dlclose failed: {}", lastDlError());
        handle_ = nullptr;
    }
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        if (handle_)
            dlclose(handle_);
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

Result<SharedLibrary> SharedLibrary::open(const std::filesystem::path& file) {
    dlerror(); // clear
    void* handle = dlopen(file.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return Error{ErrorCode::BindFailed, "dlopen failed: " + lastDlError()};
    }
    return Result<SharedLibrary>(SharedLibrary(handle));
}

void* SharedLibrary::rawSymbol(const char* name) const {
    if (!handle_)
        return nullptr;
    dlerror();
    void* sym = dlsym(handle_, name);
    if (dlerror() != nullptr)
        return nullptr;
    return sym;
}

Result<void> SharedLibrary::close() {
    if (!handle_)
        return Result<void>();
    void* h = handle_;
    handle_ = nullptr;
    if (dlclose(h) != 0) {
        return Error{ErrorCode::InternalError, "dlclose failed: " + lastDlError()};
    }
    return Result<void>();
}

} // namespace plughost::host
