#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "generator/generator.hpp"

namespace minter::cli {
/**
 * @enum CommandResult
 * @brief Тип результата выполнения команды
 */
enum class CommandResult : int {
    SUCCESS, // Успешное выполнение
    FAILURE, // Ошибка выполнения
    EXIT, // Выход из интерактивного режима
};

/**
 * @struct Command
 * @brief Структура команды
 */
struct Command {
    // Допустимое количество аргументов
    uint8_t minArgs;
    uint8_t maxArgs;
    // Команда только для интерактивного режима
    bool onlyForInteractive;
    // Функция выполнения команды
    std::function<CommandResult(const std::vector<std::string> &, std::ostream &)> execute;
};

/**
 * @class CommandProcessor
 * @brief Управляет выполнением команд генерации
 */
class CommandProcessor {
public:
    /**
     * @param generator Ссылка на генератор
     * @param singleShotMode Процессор создается для однократного выполнения команды
     */
    CommandProcessor(Generator &generator, bool singleShotMode);

    /**
     * @brief Одноразовое выполнение команды
     * @param generator Ссылка на генератор
     * @param args Команда и ее аргументы
     * @param out Поток вывода результата
     */
    static CommandResult executeShot(Generator &generator, std::vector<std::string> args,
                                     std::ostream &out = std::cout);

    /**
     * @brief Запуск интерактивного режима
     * @param generator Ссылка на генератор
     * @param in Поток команд
     * @param out Поток вывода результатов
     * @return Код завершения
     */
    static int runInteractiveMode(Generator &generator, std::istream &in = std::cin,
                                  std::ostream &out = std::cout);

private:
    Generator &generator_;
    std::unordered_map<std::string, Command> commands_; // Зарегистрированные команды
    bool singleShotMode_ = false;

    /**
     * @brief Фактическое выполнение команды
     * @param command Команда для выполнения
     * @param args Аргументы команды
     * @param out Поток вывода результата выполнения команды
     */
    CommandResult do_execute(const std::string &command, std::vector<std::string> args,
                             std::ostream &out = std::cout) const;
};
} // namespace minter::cli
