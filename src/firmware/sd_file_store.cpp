#include "sd_file_store.h"

#include <FS.h>
#include <SD.h>

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Storage";
} // namespace

bool SdFileStore::exists(const std::string &path)
{
    return SD.exists(path.c_str());
}

bool SdFileStore::read(const std::string &path, std::string &contents)
{
    File file = SD.open(path.c_str(), FILE_READ);
    if (!file)
    {
        INKWEATHER_LOGW(TAG, "Cannot open %s for reading", path.c_str());
        return false;
    }

    contents.clear();
    contents.reserve(file.size());
    uint8_t buffer[256];
    while (file.available())
    {
        const size_t count = file.read(buffer, sizeof(buffer));
        if (count == 0)
        {
            break;
        }
        contents.append(reinterpret_cast<const char *>(buffer), count);
    }
    file.close();
    return true;
}

bool SdFileStore::write(const std::string &path, const std::string &contents)
{
    File file = SD.open(path.c_str(), FILE_WRITE);
    if (!file)
    {
        INKWEATHER_LOGW(TAG, "Cannot open %s for writing", path.c_str());
        return false;
    }

    const size_t written = file.write(reinterpret_cast<const uint8_t *>(contents.data()), contents.size());
    file.close();
    if (written != contents.size())
    {
        INKWEATHER_LOGE(TAG, "Short write to %s (%u of %u bytes)", path.c_str(), static_cast<unsigned>(written),
                        static_cast<unsigned>(contents.size()));
        return false;
    }
    return true;
}

bool SdFileStore::remove(const std::string &path)
{
    return SD.remove(path.c_str());
}

bool SdFileStore::rename(const std::string &from, const std::string &to)
{
    return SD.rename(from.c_str(), to.c_str());
}

} // namespace inkweather
