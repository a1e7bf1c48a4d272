#pragma once

#include <string>
#include <cstddef>

namespace bridgelink {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);

/**
 * Write a file by writing a sibling temporary file and renaming it over the target,
 * so readers never observe a half-written file.
 * @param path Destination path
 * @param content Bytes to write
 * @param size Number of bytes
 * @param mode POSIX permission bits applied before the rename (ignored on Windows)
 * @return true on success
 */
bool write_file_atomic(const char* path, const char* content, size_t size, int mode);

// File reading
char* read_file_text(const char* path, size_t* size_out = nullptr);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File operations
bool delete_file(const char* path);
bool set_file_permissions(const char* path, int mode);

// Path utilities
std::string get_parent_directory(const char* path);
std::string combine_paths(const std::string& base, const std::string& relative);

// Utility functions
void free_file_buffer(void* buffer); // Free memory allocated by read functions

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content.c_str());
}
inline bool write_file_atomic(const std::string& path, const std::string& content, int mode = 0644) {
    return write_file_atomic(path.c_str(), content.data(), content.size(), mode);
}
inline std::string read_file_text_cpp(const std::string& path) {
    size_t size;
    char* content = read_file_text(path.c_str(), &size);
    if (!content) return "";
    std::string result(content, size);
    free_file_buffer(content);
    return result;
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline std::string get_parent_directory(const std::string& path) { return get_parent_directory(path.c_str()); }

} // namespace bridgelink
