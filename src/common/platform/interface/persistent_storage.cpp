#include "persistent_storage.hpp"
#include "../../logging.hpp"
#include <cstring>
#include <fstream>

#define TAG "persistent_storage"

PersistentStorage::PersistentStorage() : path(), image(STORAGE_SIZE, 0) {}

PersistentStorage::PersistentStorage(const std::string &path)
    : path(path), image(STORAGE_SIZE, 0)
{
        load();
}

void PersistentStorage::load()
{
        std::ifstream file(path, std::ios::binary);
        if (!file) {
                LOG_INFO(TAG, "Storage file %s not found, starting empty.",
                         path.c_str());
                return;
        }

        file.read(reinterpret_cast<char *>(image.data()), image.size());
        std::streamsize bytes_read = file.gcount();
        // A short file is fine: the rest of the image stays zeroed, which is
        // what every reader treats as 'nothing stored here'.
        LOG_DEBUG(TAG, "Loaded %ld bytes from %s", (long)bytes_read,
                  path.c_str());
}

bool PersistentStorage::flush()
{
        if (!is_file_backed()) {
                return true;
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
                LOG_ERROR(TAG, "Unable to open %s for writing.", path.c_str());
                return false;
        }
        file.write(reinterpret_cast<const char *>(image.data()), image.size());
        if (!file) {
                LOG_ERROR(TAG, "Failed to write the storage image to %s.",
                          path.c_str());
                return false;
        }
        return true;
}

bool PersistentStorage::read_bytes(int offset, void *destination,
                                   size_t length) const
{
        if (offset < 0 || (size_t)offset + length > image.size()) {
                LOG_ERROR(TAG, "Read of %zu bytes at offset %d out of range.",
                          length, offset);
                return false;
        }
        std::memcpy(destination, image.data() + offset, length);
        return true;
}

bool PersistentStorage::write_bytes(int offset, const void *source,
                                    size_t length)
{
        if (offset < 0 || (size_t)offset + length > image.size()) {
                LOG_ERROR(TAG, "Write of %zu bytes at offset %d out of range.",
                          length, offset);
                return false;
        }
        std::memcpy(image.data() + offset, source, length);
        return true;
}
