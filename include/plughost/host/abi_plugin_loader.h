#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/plugin_handle.h>

namespace plughost::host {

/**
 * Binds plugin artifacts and validates them against the ABI contract.
 *
 * bind() never leaves a module resident on failure: every error path drops the
 * SharedLibrary before returning.
 */
class AbiPluginLoader {
public:
    AbiPluginLoader() = default;
    explicit AbiPluginLoader(std::vector<std::filesystem::path> searchDirs)
        : searchDirs_(std::move(searchDirs)) {}

    void setSearchDirectories(std::vector<std::filesystem::path> dirs) {
        searchDirs_ = std::move(dirs);
    }
    const std::vector<std::filesystem::path>& searchDirectories() const { return searchDirs_; }

    /**
     * Locate the artifact: `file` as given, then inside each search directory with the
     * platform suffix and "lib" prefix variants.
     * @return NotFound when no candidate exists
     */
    Result<std::filesystem::path> resolvePath(const std::filesystem::path& file) const;

    /**
     * Resolve, bind, check the ABI version, validate and copy the descriptor.
     * @return NotFound, BindFailed or AbiMismatch
     * @throws std::bad_alloc when the dynamic loader runs out of memory mapping the module
     */
    Result<std::unique_ptr<PluginHandle>> bind(const std::filesystem::path& file) const;

    // Platform file name for a plugin stem, e.g. "echo" -> "libecho.so"
    static std::string libraryFileName(const std::string& stem);

private:
    std::vector<std::filesystem::path> searchDirs_;
};

} // namespace plughost::host
