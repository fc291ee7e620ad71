#pragma once

#include <functional>
#include <string>

namespace minter {
/**
 * @struct SlugChecks
 * @brief Проверки занятости slug во внешнем хранилище
 *
 * Не заданная проверка считается всегда возвращающей false.
 */
struct SlugChecks {
    std::function<bool(const std::string &slug, const std::string &type)> postExists;
    std::function<bool(const std::string &slug, const std::string &type)> termExists;
    std::function<bool(const std::string &slug)> userExists;
};

/**
 * @class SlugGenerator
 * @brief Формирует уникальные slug из заголовков
 */
class SlugGenerator {
public:
    explicit SlugGenerator(SlugChecks checks = {});

    void setChecks(SlugChecks checks);

    /**
     * @brief Уникальный slug для заголовка
     *
     * Для контекстов post и term при занятости добавляется "-N", для user - "N"
     * (N начиная с 1). Для остальных контекстов возвращается очищенный заголовок.
     * @param title Заголовок
     * @param context post, term, user или произвольный
     * @param type Тип записи или таксономия (для post и term)
     */
    std::string slug(const std::string &title, const std::string &context = "post",
                     const std::string &type = "post") const;

    /**
     * @brief Очищает заголовок: нижний регистр ASCII, [a-z0-9_-], пробелы в "-"
     */
    static std::string sanitizeTitle(const std::string &title);

private:
    SlugChecks checks_;
};
} // namespace minter
