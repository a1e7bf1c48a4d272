#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
    #include <errno.h>
#endif

// Filesystem module logging macros
#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace bridgelink {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }

    if (content) {
        size_t len = strlen(content);
        size_t written = fwrite(content, 1, len, file);
        fclose(file);

        if (written != len) {
            LOG_FS_ERROR("Failed to write complete content to file: " << path);
            return false;
        }
    } else {
        fclose(file);
    }

    return true;
}

bool write_file_atomic(const char* path, const char* content, size_t size, int mode) {
    if (!path) return false;

    std::string tmp_path = std::string(path) + ".tmp";

    FILE* file = fopen(tmp_path.c_str(), "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create temporary file: " << tmp_path);
        return false;
    }

    // Restrict permissions before any content lands on disk
    if (!set_file_permissions(tmp_path.c_str(), mode)) {
        fclose(file);
        delete_file(tmp_path.c_str());
        return false;
    }

    size_t written = size > 0 ? fwrite(content, 1, size, file) : 0;
    bool flushed = fflush(file) == 0;
    fclose(file);

    if (written != size || !flushed) {
        LOG_FS_ERROR("Failed to write complete content to file: " << tmp_path);
        delete_file(tmp_path.c_str());
        return false;
    }

#ifdef _WIN32
    if (!MoveFileExA(tmp_path.c_str(), path, MOVEFILE_REPLACE_EXISTING)) {
#else
    if (rename(tmp_path.c_str(), path) != 0) {
#endif
        LOG_FS_ERROR("Failed to move " << tmp_path << " into place at " << path);
        delete_file(tmp_path.c_str());
        return false;
    }

    LOG_FS_DEBUG("Wrote " << size << " bytes to " << path);
    return true;
}

char* read_file_text(const char* path, size_t* size_out) {
    if (!path) return nullptr;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_DEBUG("Failed to open file for reading: " << path);
        return nullptr;
    }

    // Get file size
    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_FS_ERROR("Failed to get file size: " << path);
        fclose(file);
        return nullptr;
    }

    // Allocate buffer (+1 for null terminator)
    char* buffer = (char*)malloc(file_size + 1);
    if (!buffer) {
        LOG_FS_ERROR("Failed to allocate memory for file: " << path);
        fclose(file);
        return nullptr;
    }

    size_t bytes_read = fread(buffer, 1, file_size, file);
    fclose(file);

    buffer[bytes_read] = '\0';

    if (size_out) {
        *size_out = bytes_read;
    }

    return buffer;
}

bool create_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

#ifdef _WIN32
    return _mkdir(path) == 0;
#else
    return mkdir(path, 0700) == 0 || errno == EEXIST;
#endif
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

    std::string path_copy(path);

    // Create parent directories first
    for (size_t i = 1; i < path_copy.size(); i++) {
        if (path_copy[i] == '/' || path_copy[i] == '\\') {
            std::string prefix = path_copy.substr(0, i);
            if (!directory_exists(prefix.c_str()) && !create_directory(prefix.c_str())) {
                LOG_FS_ERROR("Failed to create directory: " << prefix);
                return false;
            }
        }
    }

    if (!create_directory(path_copy.c_str())) {
        LOG_FS_ERROR("Failed to create directory: " << path_copy);
        return false;
    }
    return true;
}

bool delete_file(const char* path) {
    if (!path) return false;

    return remove(path) == 0;
}

bool set_file_permissions(const char* path, int mode) {
    if (!path) return false;

#ifdef _WIN32
    (void)mode;
    return true;
#else
    if (chmod(path, static_cast<mode_t>(mode)) != 0) {
        LOG_FS_ERROR("Failed to set permissions on " << path << ": " << strerror(errno));
        return false;
    }
    return true;
#endif
}

std::string get_parent_directory(const char* path) {
    if (!path) return "";

    std::string p(path);
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return p.substr(0, 1);
    }
    return p.substr(0, pos);
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

void free_file_buffer(void* buffer) {
    if (buffer) {
        free(buffer);
    }
}

} // namespace bridgelink
