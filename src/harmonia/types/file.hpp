#ifndef HARMONIA_TYPES_FILE_HPP
#define HARMONIA_TYPES_FILE_HPP

#include <cstdint>  // uint8_t
#include <istream>  // std::istream
#include <string>   // std::string
#include <vector>   // std::vector

namespace Harmonia {
    /**
     * Struct for (filename, bytes) pair.
     */
    struct File {
        /**
         * Read file specified by `path` to \ref bytes.
         * Last component of path used as filename.
         *
         * \throws RuntimeError if file can't be opened.
         */
        explicit File(const std::string& path);

        /**
         * Read stream until EOF to \ref bytes.
         */
        File(const std::string& filename, std::istream&& stream);

        /**
         * Use passed vector as file contents.
         */
        File(const std::string& filename, const std::vector<uint8_t>& bytes);

        /**
         * Helper function, write file to std::ofstream(targetPath).
         *
         * \throws RuntimeError if file can't be opened for writing.
         */
        void write(const std::string& targetPath) const;

        std::string filename;
        std::vector<uint8_t> bytes;
    };
} // namespace Harmonia

#endif // HARMONIA_TYPES_FILE_HPP
