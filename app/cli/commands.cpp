#include "cli/commands.hpp"

#include <limits>
#include <stdexcept>

#include "server/protocol.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
/**
 * @brief Схлопывание строк вектора в одну указанную строку
 * @param args Ссылка на вектор строк
 * @param targetIndex Индекс строки, в которую будут добавлены следующие элементы
 */
void mergeVector(std::vector<std::string> &args, size_t targetIndex)
{
    if (args.size() <= targetIndex + 1) {
        // Нечего объединять
        return;
    }

    std::string &out = args[targetIndex];
    for (size_t i = targetIndex + 1; i < args.size(); i++) {
        out.push_back(' ');
        out.append(std::move(args[i]));
    }
    args.erase(args.begin() + targetIndex + 1, args.end());
}

/**
 * @brief Извлечение первого слова из строки с удалением пробелов до следующего слова
 * @param input Ссылка на исходную строку
 * @return Строка со словом (если слова нет - std::nullopt)
 */
std::optional<std::string> extractFirstWord(std::string &input)
{
    // Множество пробельных символов (аналогично std::isspace())
    constexpr char spaces[] = " \t\n\r\f\v";

    const auto start = input.find_first_not_of(spaces);
    if (start == std::string::npos) {
        input.clear();
        return std::nullopt;
    }

    const auto end = input.find_first_of(spaces, start);
    auto word = input.substr(start, (end == std::string::npos ? input.size() : end) - start);

    const auto next
        = (end == std::string::npos) ? std::string::npos : input.find_first_not_of(spaces, end);
    if (next == std::string::npos) {
        input.clear();
    }
    else {
        input.erase(0, next);
    }

    return word;
}

/**
 * @brief Разбор введенной строки на команду и аргументы
 * @return Команда + аргументы (если строка пустая - std::nullopt)
 */
std::optional<std::pair<std::string, std::vector<std::string>>> parseInput(std::string input)
{
    auto command = extractFirstWord(input);
    if (!command.has_value()) {
        return std::nullopt;
    }

    std::vector<std::string> args;
    while (true) {
        auto word = extractFirstWord(input);
        if (!word.has_value()) {
            break;
        }
        args.push_back(std::move(*word));
    }
    return std::make_pair(std::move(*command), std::move(args));
}

/**
 * @brief Разбор целочисленного аргумента
 * @throw std::invalid_argument если строка не является целым числом в диапазоне int
 */
long long parseInteger(const std::string &value, const std::string &name,
                       long long max = std::numeric_limits<int>::max())
{
    size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &pos);
    }
    catch (const std::exception &) {
        pos = 0;
    }
    if (pos != value.size() || value.empty() || result > max
        || result < std::numeric_limits<int>::min()) {
        throw std::invalid_argument("некорректное значение " + name + ": " + value);
    }
    return result;
}

int parseInt(const std::string &value, const std::string &name)
{
    return static_cast<int>(parseInteger(value, name));
}

bool parseYesNo(const std::string &value, const std::string &name)
{
    if (value == "yes" || value == "true" || value == "1") {
        return true;
    }
    if (value == "no" || value == "false" || value == "0") {
        return false;
    }
    throw std::invalid_argument("ожидается yes или no для " + name + ": " + value);
}

/**
 * @brief Параметры кода из аргументов вида name=value
 */
minter::CodeOptions parseCodeOptions(const std::vector<std::string> &args)
{
    minter::CodeOptions options;
    for (const auto &arg : args) {
        const auto pos = arg.find('=');
        if (pos == std::string::npos) {
            throw std::invalid_argument("ожидается аргумент вида имя=значение: " + arg);
        }
        const auto name = arg.substr(0, pos);
        const auto value = arg.substr(pos + 1);

        if (name == "length") {
            options.length = parseInt(value, name);
        }
        else if (name == "segments") {
            options.segments = parseInt(value, name);
        }
        else if (name == "separator") {
            options.separator = value;
        }
        else if (name == "case") {
            if (value != "upper" && value != "lower") {
                throw std::invalid_argument("ожидается upper или lower для case: " + value);
            }
            options.uppercase = value == "upper";
        }
        else if (name == "numbers") {
            options.numbers = parseYesNo(value, name);
        }
        else if (name == "exclude") {
            options.exclude = std::set<char>(value.begin(), value.end());
        }
        else if (name == "prefix") {
            options.prefix = value;
        }
        else if (name == "suffix") {
            options.suffix = value;
        }
        else {
            throw std::invalid_argument("неизвестный параметр кода: " + name);
        }
    }
    return options;
}
} // namespace

namespace minter::cli {
CommandProcessor::CommandProcessor(Generator &generator, bool singleShotMode)
    : generator_(generator)
    , singleShotMode_(singleShotMode)
{
    // Составной код
    commands_["code"]
        = { 0, 8, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                out << generator_.code(parseCodeOptions(args)) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Случайная строка
    commands_["string"]
        = { 0, 3, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto length = args.size() > 0 ? parseInt(args[0], "LENGTH") : 16;
                const auto charset = args.size() > 1 ? args[1] : std::string("alnum");
                bool secure = true;
                if (args.size() > 2) {
                    if (args[2] != "secure" && args[2] != "insecure") {
                        throw std::invalid_argument("ожидается secure или insecure: " + args[2]);
                    }
                    secure = args[2] == "secure";
                }
                out << generator_.string(length, charset, secure) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Токен безопасности
    commands_["token"]
        = { 0, 3, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto length = args.size() > 0 ? parseInt(args[0], "LENGTH") : 32;
                const auto format
                    = args.size() > 1 ? parseTokenFormat(args[1]) : TokenFormat::ALNUM;
                const auto action = args.size() > 2 ? args[2] : std::string();
                out << generator_.token(length, action, format) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Токен одноразовой ссылки
    commands_["magic-token"]
        = { 0, 3, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto expiresIn = args.size() > 0
                    ? parseInteger(args[0], "EXPIRES_IN", std::numeric_limits<long long>::max())
                    : 86400;
                const auto context = args.size() > 1 ? args[1] : std::string();
                const auto length = args.size() > 2 ? parseInt(args[2], "LENGTH") : 32;
                const auto record = generator_.magicToken(expiresIn, context, length);
                out << server::tokenRecordToJson(record).dump(2) << "\n";
                return CommandResult::SUCCESS;
            } };

    // UUID v4
    commands_["uuid"]
        = { 0, 0, false, [this](const std::vector<std::string> &, std::ostream &out) {
               out << generator_.uuid() << "\n";
               return CommandResult::SUCCESS;
           } };

    // Ключ с префиксом
    commands_["key"]
        = { 0, 2, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto prefix = args.size() > 0 ? args[0] : std::string("id");
                const auto length = args.size() > 1 ? parseInt(args[1], "LENGTH") : 9;
                out << generator_.key(prefix, length) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Короткий идентификатор
    commands_["short-id"]
        = { 0, 1, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto length = args.size() > 0 ? parseInt(args[0], "LENGTH") : 7;
                out << generator_.shortId(length) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Следующее значение последовательности
    commands_["seq"]
        = { 0, 3, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto context = args.size() > 0 ? args[0] : std::string("default");
                const auto prefix = args.size() > 1 ? args[1] : std::string();
                const auto padding = args.size() > 2 ? parseInt(args[2], "PADDING") : 8;
                out << generator_.sequentialId(prefix, padding, context) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Slug из заголовка (все аргументы объединяются в заголовок)
    commands_["slug"]
        = { 1, 1, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                out << generator_.slug(args[0]) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Команда выхода
    commands_["exit"] = { 0, 0, true, [](const std::vector<std::string> &, std::ostream &) {
                             return CommandResult::EXIT;
                         } };

    // Команда вывода справки
    commands_["help"] = {
        0, 0, true,
        [](const std::vector<std::string> &, std::ostream &out) -> CommandResult {
            out << "Доступные команды:\n"
                << "  code [имя=значение ...]             Составной код (length, segments,\n"
                << "                                      separator, case, numbers, exclude,\n"
                << "                                      prefix, suffix)\n"
                << "  string [ДЛИНА] [НАБОР] [secure|insecure]\n"
                << "                                      Случайная строка\n"
                << "  token [ДЛИНА] [alnum|hex] [ДЕЙСТВИЕ] Токен безопасности\n"
                << "  magic-token [СЕКУНДЫ] [КОНТЕКСТ] [ДЛИНА]\n"
                << "                                      Токен одноразовой ссылки\n"
                << "  uuid                                UUID v4\n"
                << "  key [ПРЕФИКС] [ДЛИНА]               Ключ вида префикс_xxxxxxxxx\n"
                << "  short-id [ДЛИНА]                    Короткий идентификатор для URL\n"
                << "  seq [КОНТЕКСТ] [ПРЕФИКС] [ШИРИНА]   Следующий последовательный номер\n"
                << "  slug <ЗАГОЛОВОК>                    Slug из заголовка\n"
                << "  exit                                Выход из интерактивного режима\n"
                << "  help                                Показать справку\n\n";
            return CommandResult::SUCCESS;
        }
    };
}

CommandResult CommandProcessor::do_execute(const std::string &command,
                                           std::vector<std::string> args, std::ostream &out) const
{
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        LOG_ERROR << "Ошибка: неизвестная команда: " << command << ".\n"
                  << "Введите `help` для получения списка доступных команд";
        return CommandResult::FAILURE;
    }

    if (command == "slug") {
        // Заголовок может состоять из нескольких слов
        mergeVector(args, 0);
    }

    const auto &cmd = it->second;
    if (args.size() < cmd.minArgs || args.size() > cmd.maxArgs) {
        LOG_ERROR << "Ошибка: неправильное использование команды " << command << ".\n"
                  << "Введите `help` для получения информации об использовании команд";
        return CommandResult::FAILURE;
    }

    if (singleShotMode_ && cmd.onlyForInteractive) {
        LOG_ERROR << "Ошибка: команда " << command << " доступна только в интерактивном режиме";
        return CommandResult::FAILURE;
    }

    try {
        return cmd.execute(args, out);
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка выполнения команды " << command << ": " << e.what();
        return CommandResult::FAILURE;
    }
}

CommandResult CommandProcessor::executeShot(Generator &generator, std::vector<std::string> args,
                                            std::ostream &out)
{
    if (args.empty()) {
        LOG_ERROR << "Ошибка: необходимо указать команду для выполнения.\n"
                  << "Запустите с --help для получения списка доступных команд";
        return CommandResult::FAILURE;
    }

    const auto command = std::move(args.front());
    args.erase(args.begin());

    const auto processor = CommandProcessor(generator, true);
    return processor.do_execute(command, std::move(args), out);
}

int CommandProcessor::runInteractiveMode(Generator &generator, std::istream &in,
                                         std::ostream &out)
{
    const auto processor = CommandProcessor(generator, false);

    constexpr char PROMPT[] = "minter> ";
    std::string input;

    out << "Minter - интерактивный режим\n"
        << "Введите команду или 'help' для получения справки, 'exit' для выхода\n";

    while (true) {
        out << PROMPT << std::flush;
        std::getline(in, input);

        if (in.eof() && input.empty()) {
            out << "\n";
            return 0;
        }
        if (!in && !in.eof()) {
            LOG_ERROR << "Ошибка ввода. Завершение работы";
            return 1;
        }

        auto parsedData = parseInput(std::move(input));
        input.clear();
        if (!parsedData.has_value()) {
            continue;
        }
        auto &[command, args] = *parsedData;

        if (processor.do_execute(command, std::move(args), out) == CommandResult::EXIT) {
            out << "Выход из интерактивного режима\n";
            return 0;
        }
    }
    UNREACHABLE("Выход из цикла возможен только через команду exit или конец ввода");
}
} // namespace minter::cli
