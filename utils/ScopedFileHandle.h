#pragma once

#include <cstdio>
#include <string>

namespace utils
{

// Owns a stdio FILE and closes it on destruction
class ScopedFileHandle
{
public:
    ScopedFileHandle() : _file(nullptr) {}
    explicit ScopedFileHandle(FILE* file) : _file(file) {}
    ~ScopedFileHandle() { reset(); }

    ScopedFileHandle(const ScopedFileHandle&) = delete;
    ScopedFileHandle& operator=(const ScopedFileHandle&) = delete;

    // empty path gives an empty handle
    static FILE* open(const std::string& path, const char* mode)
    {
        return path.empty() ? nullptr : std::fopen(path.c_str(), mode);
    }

    FILE* get() { return _file; }
    explicit operator bool() const { return _file != nullptr; }

    void reset(FILE* file = nullptr)
    {
        if (_file)
        {
            std::fclose(_file);
        }
        _file = file;
    }

private:
    FILE* _file;
};

} // namespace utils
