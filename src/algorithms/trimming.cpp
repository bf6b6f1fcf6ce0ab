#include "trimming.h"
#include <algorithm>
#include <stdexcept>

namespace watsim {

TrimStrategy parse_trim_strategy(const std::string& name) {
    if (name == "head") return TrimStrategy::Head;
    if (name == "middle") return TrimStrategy::Middle;
    if (name == "tail") return TrimStrategy::Tail;
    if (name == "random") return TrimStrategy::Random;
    throw std::invalid_argument("Unknown trimming method: '" + name +
                                "' (expected head, middle, tail or random)");
}

const char* trim_strategy_name(TrimStrategy strategy) {
    switch (strategy) {
    case TrimStrategy::Head: return "head";
    case TrimStrategy::Middle: return "middle";
    case TrimStrategy::Tail: return "tail";
    case TrimStrategy::Random: return "random";
    }
    return "unknown";
}

namespace {

TrimWindow whole(size_t total, size_t target) {
    TrimWindow w;
    w.total = total;
    w.target = target;
    w.start = 0;
    w.kept = total;
    return w;
}

}  // namespace

TrimWindow select_window(size_t total, size_t target, TrimStrategy strategy, std::mt19937& rng) {
    if (target >= total) {
        return whole(total, target);
    }

    TrimWindow w;
    w.total = total;
    w.target = target;
    w.kept = target;

    switch (strategy) {
    case TrimStrategy::Head:
        w.start = 0;
        break;
    case TrimStrategy::Tail:
        w.start = total - target;
        break;
    case TrimStrategy::Middle:
        w.start = (total - target) / 2;
        break;
    case TrimStrategy::Random: {
        std::uniform_int_distribution<size_t> dist(0, total - target);
        w.start = dist(rng);
        break;
    }
    }
    return w;
}

TrimWindow select_window(size_t total, size_t target, TrimStrategy strategy) {
    if (strategy == TrimStrategy::Random) {
        throw std::invalid_argument("random trimming needs a seeded generator");
    }
    std::mt19937 unused;
    return select_window(total, target, strategy, unused);
}

}  // namespace watsim
