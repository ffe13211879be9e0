#include "inkweather/file_store.h"

#include "inkweather/log.h"

namespace inkweather
{

bool writeFileAtomically(FileStore &store, const std::string &path, const std::string &contents)
{
    const std::string temporary = path + ".tmp";
    if (!store.write(temporary, contents))
    {
        return false;
    }
    if (store.exists(path) && !store.remove(path))
    {
        if (!store.remove(temporary))
        {
            INKWEATHER_LOGW("Storage", "Left %s behind.", temporary.c_str());
        }
        return false;
    }
    return store.rename(temporary, path);
}

} // namespace inkweather
