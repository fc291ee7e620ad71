#include "storage/secret_file.hpp"

#include <algorithm>
#include <cctype>

#include "generator/errors.hpp"
#include "generator/random_source.hpp"
#include "utils/digest.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
constexpr char SECRET_FILE_NAME[] = "secret.key";
constexpr size_t SECRET_BYTES = 32;

bool isValidSecret(const std::string &secret)
{
    return secret.size() == SECRET_BYTES * 2
        && std::all_of(secret.begin(), secret.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string secureSecret()
{
    minter::SecureRandomSource source;
    std::string bytes(SECRET_BYTES, '\0');
    if (!source.randomBytes(reinterpret_cast<uint8_t *>(bytes.data()), bytes.size())) {
        throw minter::SecureSourceUnavailable("Не удалось получить случайные байты для секрета");
    }
    return minter::utils::toHex(bytes);
}
} // namespace

namespace minter {
std::string loadOrCreateSecret(const std::filesystem::path &dataDir)
{
    if (!utils::ensureDirectoryExists(dataDir)) {
        throw StorageError("Не удалось подготовить директорию хранилища: " + dataDir.string());
    }

    const auto secretPath = dataDir / SECRET_FILE_NAME;
    if (utils::isFileReadable(secretPath)) {
        std::string secret;
        if (!utils::safeFileRead(secretPath, secret)) {
            throw StorageError("Не удалось прочитать секрет: " + secretPath.string());
        }
        while (!secret.empty() && std::isspace(static_cast<unsigned char>(secret.back()))) {
            secret.pop_back();
        }
        if (!isValidSecret(secret)) {
            throw StorageError("Файл секрета поврежден: " + secretPath.string());
        }
        return secret;
    }

    auto secret = secureSecret();
    if (!utils::atomicFileWrite(secretPath, secret + "\n")) {
        throw StorageError("Не удалось сохранить секрет: " + secretPath.string());
    }

    std::error_code ec;
    std::filesystem::permissions(secretPath,
                                 std::filesystem::perms::owner_read
                                     | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw StorageError("Не удалось ограничить права на файл секрета: " + ec.message());
    }

    LOG_INFO << "Создан новый секрет: " << secretPath.string();
    return secret;
}

std::string generateEphemeralSecret()
{
    RandomSelector random;
    return utils::toHex(random.bytes(SECRET_BYTES));
}
} // namespace minter
