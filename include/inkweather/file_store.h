#ifndef INKWEATHER_FILE_STORE_H
#define INKWEATHER_FILE_STORE_H

#include <string>

namespace inkweather
{

// Minimal file access; the SD card on the device, fakes in tests.
class FileStore
{
public:
    virtual ~FileStore() = default;

    virtual bool exists(const std::string &path) = 0;
    virtual bool read(const std::string &path, std::string &contents) = 0;
    virtual bool write(const std::string &path, const std::string &contents) = 0;
    virtual bool remove(const std::string &path) = 0;
    virtual bool rename(const std::string &from, const std::string &to) = 0;
};

// Writes to "<path>.tmp", then swaps it in so readers never see a partial file.
bool writeFileAtomically(FileStore &store, const std::string &path, const std::string &contents);

} // namespace inkweather

#endif // INKWEATHER_FILE_STORE_H
