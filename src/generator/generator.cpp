#include "generator/generator.hpp"

#include "generator/errors.hpp"
#include "utils/logger.hpp"

namespace minter {
namespace {
std::unique_ptr<CounterStore> requireStore(std::unique_ptr<CounterStore> store)
{
    if (!store) {
        throw StorageError("Хранилище счетчиков не задано");
    }
    return store;
}

std::unique_ptr<RandomSelector> requireRandom(std::unique_ptr<RandomSelector> random)
{
    if (!random) {
        throw SecureSourceUnavailable("Источник случайности не задан");
    }
    return random;
}
} // namespace

Generator::Generator(GeneratorConfig config, std::unique_ptr<CounterStore> store,
                     std::unique_ptr<RandomSelector> random)
    : store_(requireStore(std::move(store)))
    , random_(requireRandom(std::move(random)))
    , strings_(*random_)
    , codes_(strings_)
    , nonces_(config.secret, config.nonceLifetime, config.clock)
    , tokens_(*random_, strings_, nonces_, config.secret, config.clock)
    , sequences_(*store_)
    , ids_(*random_, strings_)
{
    if (config.secret.empty()) {
        LOG_WARNING << "Секрет генератора пуст, токены с привязкой предсказуемы";
    }
}
} // namespace minter
