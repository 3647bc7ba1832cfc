#include <harmonia/types/file.hpp>

#include <iterator>                    // std::istreambuf_iterator
#include <algorithm>                   // std::copy
#include <fstream>                     // std::ifstream
#include <harmonia/exceptions.hpp>     // RuntimeError

#if _WIN32
    #define PATH_DELIMITER '\\'
#else
    #define PATH_DELIMITER '/'
#endif

namespace Harmonia {

namespace {
    std::vector<uint8_t> readWholeFile(const std::string& path) {
        std::ifstream input(path, std::ios_base::binary);
        if (!input) throw RuntimeError(std::string("Failed to open file: ") + path, -1);

        return std::vector<uint8_t>(std::istreambuf_iterator<char>(input.rdbuf()),
                                    std::istreambuf_iterator<char>());
    }
}

File::File(const std::string& path)
    : filename(path.substr(path.rfind(PATH_DELIMITER) == std::string::npos ? 0 : path.rfind(PATH_DELIMITER) + 1))
    , bytes(readWholeFile(path)) {}

File::File(const std::string& filename, std::istream&& stream)
    : filename(filename)
    , bytes(std::istreambuf_iterator<char>(stream.rdbuf()),
            std::istreambuf_iterator<char>()) {}

File::File(const std::string& filename, const std::vector<uint8_t>& bytes)
    : filename(filename)
    , bytes(bytes) {}

void File::write(const std::string& targetPath) const {
    std::ofstream output(targetPath, std::ios_base::binary | std::ios_base::trunc);
    if (!output) throw RuntimeError(std::string("Failed to open file for writing: ") + targetPath, -1);

    std::copy(bytes.begin(), bytes.end(), std::ostreambuf_iterator<char>(output.rdbuf()));
}

} // namespace Harmonia
