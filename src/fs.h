#pragma once

#include <string>
#include <cstdint>
#include <cstdio>

namespace whisp {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);
bool is_directory(const char* path);

// Directory operations
bool create_directory(const char* path, unsigned int mode = 0755);
bool create_directories(const char* path, unsigned int mode = 0755); // Create parent directories if needed

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);

// Path utilities
std::string get_filename_from_path(const std::string& path);
std::string combine_paths(const std::string& base, const std::string& relative);

/**
 * Owning handle to an open file.
 *
 * Offsets are 64-bit. The handle closes itself on destruction; call close()
 * explicitly when the flush result matters.
 */
class File {
public:
    File() noexcept;
    ~File();

    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    /**
     * Open an existing file for reading
     * @param path File to open
     * @param error_out Optional error description on failure
     * @return Open handle, or a closed one on failure
     */
    static File open_read(const std::string& path, std::string* error_out = nullptr);

    /**
     * Create (or truncate) a file for writing, readable and writable by the
     * owner only (0600 on POSIX)
     * @param path File to create
     * @param error_out Optional error description on failure
     * @return Open handle, or a closed one on failure
     */
    static File create_private(const std::string& path, std::string* error_out = nullptr);

    bool is_open() const { return file_ != nullptr; }
    const std::string& path() const { return path_; }

    bool seek(uint64_t offset, std::string* error_out = nullptr);

    /**
     * Read up to size bytes at the current position
     * @return Number of bytes read (short only at end of file), -1 on error
     */
    int64_t read(void* buffer, size_t size, std::string* error_out = nullptr);

    bool write(const void* data, size_t size, std::string* error_out = nullptr);

    /**
     * Flush and close the handle
     * @return false if flushing buffered data failed
     */
    bool close(std::string* error_out = nullptr);

private:
    File(FILE* file, const std::string& path);

    FILE* file_;
    std::string path_;
};

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool is_directory(const std::string& path) { return is_directory(path.c_str()); }
inline bool create_directories(const std::string& path, unsigned int mode = 0755) {
    return create_directories(path.c_str(), mode);
}
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }

} // namespace whisp
