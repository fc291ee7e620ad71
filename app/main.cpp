#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cli/commands.hpp"
#include "generator/generator.hpp"
#include "server/server.hpp"
#include "storage/counter_store.hpp"
#include "storage/file_counter_store.hpp"
#include "storage/secret_file.hpp"
#include "utils/logger.hpp"

// Вывод справки
void printHelp(const char *executable)
{
    std::cout
        << "Использование:\n"
        << "  " << executable << " [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]\n\n"

        << "Описание:\n"
        << "  Генерация идентификаторов, кодов, токенов и slug.\n\n"

        << "Опции:\n"
        << "  --storage=ПУТЬ         Директория для счетчиков последовательностей и секрета.\n"
        << "                         Без нее счетчики хранятся в памяти процесса, а секрет\n"
        << "                         генерируется заново при каждом запуске.\n"
        << "  --secret=ЗНАЧЕНИЕ      Секрет для токенов с привязкой к действию\n"
        << "  --interactive          Интерактивный режим\n"
        << "  --server               Серверный режим\n"
        << "  --socket=ПУТЬ          Путь к Unix-сокету (по умолчанию: /TMP/minter.sock).\n"
        << "                         Сокет не должен существовать.\n"
        << "  --log-file=ПУТЬ        Дублировать журнал в файл\n"
        << "  --verbose              Выводить отладочные сообщения\n"
        << "  --disable-warnings     Отключить вывод сообщений-предупреждений\n"
        << "  --help                 Показать справку\n\n"

        << "Команды:\n"
        << "  code [length=N] [segments=N] [separator=S] [case=upper|lower]\n"
        << "       [numbers=yes|no] [exclude=СИМВОЛЫ] [prefix=S] [suffix=S]\n"
        << "  string [ДЛИНА] [НАБОР] [secure|insecure]\n"
        << "         НАБОР: alnum, alpha, numeric, hex или произвольные символы\n"
        << "  token [ДЛИНА] [alnum|hex] [ДЕЙСТВИЕ]\n"
        << "  magic-token [СЕКУНДЫ] [КОНТЕКСТ] [ДЛИНА]\n"
        << "  uuid\n"
        << "  key [ПРЕФИКС] [ДЛИНА]\n"
        << "  short-id [ДЛИНА]\n"
        << "  seq [КОНТЕКСТ] [ПРЕФИКС] [ШИРИНА]\n"
        << "  slug <ЗАГОЛОВОК>\n\n"

        << "Режимы работы:\n"
        << "  По умолчанию выполняется одна команда, если не указаны --interactive или "
           "--server.\n"
        << "  В серверном режиме запросы принимаются в формате [4 байта длины][JSON]:\n"
        << "    {\"request_id\": \"...\", \"command\": \"code\", \"params\": {...}}\n";
}

// Получение значения опции из аргументов командной строки
std::optional<std::string> getOptionValue(const std::string &option, std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];
        // Проверка формата `--option=value`
        const auto pos = arg.find('=');
        if (pos != std::string::npos && arg.compare(0, pos, option) == 0) {
            auto value = arg.substr(pos + 1);
            args.erase(args.begin() + i);
            return value;
        }
        // Проверка формата `--option value`
        if (arg == option && i + 1 < args.size()) {
            auto value = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return value;
        }
    }
    return std::nullopt;
}

// Проверка наличия флага в аргументах командной строки
bool hasFlag(const std::string &flag, std::vector<std::string> &args)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it != args.end()) {
        args.erase(it);
        return true;
    }
    return false;
}

// Проверка оставшихся флагов: если флаги остались, то это ошибка
bool checkLastArgs(const std::vector<std::string> &args)
{
    if (args.empty()) {
        return true;
    }

    LOG_ERROR << "Ошибка: неизвестные аргументы:";
    for (const auto &arg : args) {
        LOG_ERROR << "\t" << arg;
    }
    return false;
}

int main(int argc, char *argv[])
{
    const auto executable = (argc > 0) ? argv[0] : "minter";
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || hasFlag("--help", args)) {
        printHelp(executable);
        return 0;
    }

    const auto verbose = hasFlag("--verbose", args);
    const auto disableWarnings = hasFlag("--disable-warnings", args);
    const auto logFile = getOptionValue("--log-file", args);

    auto minLevel = minter::utils::LogLevel::WARNING;
    if (verbose) {
        minLevel = minter::utils::LogLevel::DEBUG;
    }
    else if (disableWarnings) {
        minLevel = minter::utils::LogLevel::ERROR;
    }
    std::optional<std::filesystem::path> logPath;
    if (logFile.has_value()) {
        logPath = std::filesystem::path(*logFile);
    }
    minter::utils::Logger::getInstance().enable(true, logPath, minLevel);

    const auto interactiveMode = hasFlag("--interactive", args);
    const auto serverMode = hasFlag("--server", args);
    const auto socketPath = getOptionValue("--socket", args);
    const auto storageOption = getOptionValue("--storage", args);
    const auto secretOption = getOptionValue("--secret", args);

    if (interactiveMode && serverMode) {
        LOG_ERROR << "Ошибка: --interactive и --server нельзя использовать одновременно";
        return 1;
    }

    // Для интерактивного и серверного режимов не должно остаться аргументов
    if ((interactiveMode || serverMode) && !checkLastArgs(args)) {
        return 1;
    }

    try {
        minter::GeneratorConfig config;
        std::unique_ptr<minter::CounterStore> store;

        if (storageOption.has_value()) {
            const auto storagePath = std::filesystem::path(*storageOption);
            store = std::make_unique<minter::FileCounterStore>(storagePath);
            config.secret = secretOption.has_value() ? *secretOption
                                                     : minter::loadOrCreateSecret(storagePath);
        }
        else {
            store = std::make_unique<minter::MemoryCounterStore>();
            if (secretOption.has_value()) {
                config.secret = *secretOption;
            }
            else {
                LOG_WARNING << "Секрет не задан (--secret или --storage), используется случайный "
                               "секрет процесса";
                config.secret = minter::generateEphemeralSecret();
            }
        }

        minter::Generator generator(std::move(config), std::move(store));

        if (serverMode) {
            return minter::server::Server::startServer(generator, socketPath);
        }

        if (interactiveMode) {
            return minter::cli::CommandProcessor::runInteractiveMode(generator);
        }

        const auto result = minter::cli::CommandProcessor::executeShot(generator, std::move(args));
        return result == minter::cli::CommandResult::SUCCESS ? 0 : 1;
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка инициализации: " << e.what();
        return 1;
    }
}
