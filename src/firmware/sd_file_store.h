#ifndef INKWEATHER_FIRMWARE_SD_FILE_STORE_H
#define INKWEATHER_FIRMWARE_SD_FILE_STORE_H

#include "inkweather/file_store.h"

namespace inkweather
{

// FileStore over the SD card; SD.begin() must have succeeded.
class SdFileStore : public FileStore
{
public:
    bool exists(const std::string &path) override;
    bool read(const std::string &path, std::string &contents) override;
    bool write(const std::string &path, const std::string &contents) override;
    bool remove(const std::string &path) override;
    bool rename(const std::string &from, const std::string &to) override;
};

} // namespace inkweather

#endif // INKWEATHER_FIRMWARE_SD_FILE_STORE_H
