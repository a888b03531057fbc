#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cerrno>
#include <utility>
#include <sys/stat.h>
#include <fcntl.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
#endif

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace whisp {

namespace {

std::string errno_message(const char* what, const std::string& path) {
    return std::string(what) + " " + path + ": " + std::strerror(errno);
}

void set_error(std::string* error_out, const std::string& message) {
    if (error_out) {
        *error_out = message;
    }
}

} // namespace

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return false;
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return static_cast<int64_t>(st.st_size);
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISREG(st.st_mode);
    }
    return false;
}

bool is_directory(const char* path) {
    return directory_exists(path);
}

bool create_directory(const char* path, unsigned int mode) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

#ifdef _WIN32
    (void)mode;
    return _mkdir(path) == 0;
#else
    return mkdir(path, static_cast<mode_t>(mode)) == 0;
#endif
}

bool create_directories(const char* path, unsigned int mode) {
    if (!path || !*path) return false;

    if (directory_exists(path)) {
        return true;
    }

    std::string partial(path);
    for (size_t i = 1; i < partial.size(); ++i) {
        if (partial[i] == '/' || partial[i] == '\\') {
            char saved = partial[i];
            partial[i] = '\0';
            if (!directory_exists(partial.c_str()) && !create_directory(partial.c_str(), mode)) {
                LOG_FS_ERROR("Failed to create directory: " << partial.c_str());
                return false;
            }
            partial[i] = saved;
        }
    }

    return create_directory(partial.c_str(), mode);
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

bool delete_directory(const char* path) {
    if (!path) return false;

#ifdef _WIN32
    return RemoveDirectoryA(path) != 0;
#else
    return rmdir(path) == 0;
#endif
}

std::string get_filename_from_path(const std::string& path) {
    size_t end = path.size();
    while (end > 1 && (path[end - 1] == '/' || path[end - 1] == '\\')) {
        --end;
    }
    size_t pos = path.find_last_of("/\\", end == 0 ? 0 : end - 1);
    if (pos == std::string::npos) {
        return path.substr(0, end);
    }
    if (pos + 1 >= end) {
        // Path made of separators only
        return path.substr(0, 1);
    }
    return path.substr(pos + 1, end - pos - 1);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

//=============================================================================
// File
//=============================================================================

File::File() noexcept : file_(nullptr) {}

File::File(FILE* file, const std::string& path) : file_(file), path_(path) {}

File::~File() {
    if (file_) {
        fclose(file_);
    }
}

File::File(File&& other) noexcept : file_(other.file_), path_(std::move(other.path_)) {
    other.file_ = nullptr;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        if (file_) {
            fclose(file_);
        }
        file_ = other.file_;
        path_ = std::move(other.path_);
        other.file_ = nullptr;
    }
    return *this;
}

File File::open_read(const std::string& path, std::string* error_out) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        set_error(error_out, errno_message("failed to open", path));
        return File();
    }
    return File(file, path);
}

File File::create_private(const std::string& path, std::string* error_out) {
#ifdef _WIN32
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        set_error(error_out, errno_message("failed to create", path));
        return File();
    }
#else
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (fd < 0) {
        set_error(error_out, errno_message("failed to create", path));
        return File();
    }
    FILE* file = fdopen(fd, "wb");
    if (!file) {
        set_error(error_out, errno_message("failed to open stream for", path));
        ::close(fd);
        return File();
    }
#endif
    LOG_FS_DEBUG("Created file " << path);
    return File(file, path);
}

bool File::seek(uint64_t offset, std::string* error_out) {
    if (!file_) {
        set_error(error_out, "file is not open");
        return false;
    }
#ifdef _WIN32
    int rc = _fseeki64(file_, static_cast<__int64>(offset), SEEK_SET);
#else
    int rc = fseeko(file_, static_cast<off_t>(offset), SEEK_SET);
#endif
    if (rc != 0) {
        set_error(error_out, errno_message("failed to seek in", path_));
        return false;
    }
    return true;
}

int64_t File::read(void* buffer, size_t size, std::string* error_out) {
    if (!file_) {
        set_error(error_out, "file is not open");
        return -1;
    }
    size_t bytes_read = fread(buffer, 1, size, file_);
    if (bytes_read < size && ferror(file_)) {
        set_error(error_out, errno_message("failed to read", path_));
        clearerr(file_);
        return -1;
    }
    return static_cast<int64_t>(bytes_read);
}

bool File::write(const void* data, size_t size, std::string* error_out) {
    if (!file_) {
        set_error(error_out, "file is not open");
        return false;
    }
    if (size == 0) {
        return true;
    }
    size_t written = fwrite(data, 1, size, file_);
    if (written != size) {
        set_error(error_out, errno_message("failed to write", path_));
        clearerr(file_);
        return false;
    }
    return true;
}

bool File::close(std::string* error_out) {
    if (!file_) {
        return true;
    }
    int rc = fclose(file_);
    file_ = nullptr;
    if (rc != 0) {
        set_error(error_out, errno_message("failed to close", path_));
        return false;
    }
    return true;
}

} // namespace whisp
