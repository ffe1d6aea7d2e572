#pragma once
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

/// Size of the storage image in bytes.
constexpr int STORAGE_SIZE = 4096;

/**
 * Byte-addressable persistent storage modeled after an EEPROM: callers store
 * plain structs at fixed offsets using `put` and read them back with `get`.
 *
 * The whole image is kept in memory. When the storage is backed by a file, the
 * image is read from it on construction and every `put` writes it back, so that
 * the data survives even if the process is killed. A default-constructed
 * storage lives only in memory.
 *
 * Nothing here validates the contents: a freshly created storage is all
 * zeroes, and callers must check that what they read back makes sense.
 */
class PersistentStorage
{
      public:
        PersistentStorage();
        explicit PersistentStorage(const std::string &path);

        /**
         * Copies `sizeof(T)` bytes starting at `offset` into `value`. Returns
         * false (leaving `value` untouched) if the range does not fit in the
         * storage.
         */
        template <typename T> bool get(int offset, T &value) const
        {
                static_assert(std::is_trivially_copyable<T>::value,
                              "Only trivially copyable types can be stored");
                return read_bytes(offset, &value, sizeof(T));
        }

        /**
         * Writes `value` at `offset` and flushes the image to the backing
         * file. Returns false if the range does not fit or the file could not
         * be written; the in-memory image is updated in the latter case.
         */
        template <typename T> bool put(int offset, const T &value)
        {
                static_assert(std::is_trivially_copyable<T>::value,
                              "Only trivially copyable types can be stored");
                if (!write_bytes(offset, &value, sizeof(T))) {
                        return false;
                }
                return flush();
        }

        bool is_file_backed() const { return !path.empty(); }
        const std::string &get_path() const { return path; }

      private:
        std::string path;
        std::vector<unsigned char> image;

        bool read_bytes(int offset, void *destination, size_t length) const;
        bool write_bytes(int offset, const void *source, size_t length);
        void load();
        bool flush();
};
