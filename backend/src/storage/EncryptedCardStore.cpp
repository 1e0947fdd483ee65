#include "EncryptedCardStore.hpp"
#include "Storage.hpp"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "CWCARDS1\n";
static const char RECORD_END[] = "---";
static const char NO_REVIEW[] = "-";

namespace {

std::string escapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
        }
    }
    return out;
}

bool unescapeText(const std::string& s, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') { out += s[i]; continue; }
        if (++i == s.size()) return false;
        switch (s[i]) {
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: return false;
        }
    }
    return true;
}

bool parseRecord(std::istream& in, const std::string& id, Card& card) {
    std::string question, answer, interval, ease, last, next, created, sep;
    if (!std::getline(in, question) || !std::getline(in, answer) ||
        !std::getline(in, interval) || !std::getline(in, ease) ||
        !std::getline(in, last) || !std::getline(in, next) ||
        !std::getline(in, created) || !std::getline(in, sep))
    {
        spdlog::error("Truncated card record '{}'", id);
        return false;
    }

    if (sep != RECORD_END) {
        spdlog::error("Card record '{}' missing terminator", id);
        return false;
    }

    card.id = id;
    if (!unescapeText(question, card.question) || !unescapeText(answer, card.answer)) {
        spdlog::error("Bad escape sequence in card '{}'", id);
        return false;
    }

    try {
        std::size_t used = 0;
        card.interval = std::stoi(interval, &used);
        if (used != interval.size()) return false;
        card.ease_factor = std::stod(ease, &used);
        if (used != ease.size()) return false;
    }
    catch (const std::logic_error& e) {
        spdlog::error("Bad number in card '{}': {}", id, e.what());
        return false;
    }

    if (card.interval < 0 || !(card.ease_factor >= Card::MIN_EASE)) {
        spdlog::error("Card '{}' violates scheduling invariants (interval={}, ease={})",
            id, card.interval, card.ease_factor);
        return false;
    }

    if (last == NO_REVIEW) {
        card.last_review.reset();
    }
    else {
        auto t = parseTimestamp(last);
        if (!t) { spdlog::error("Bad last review timestamp in card '{}'", id); return false; }
        card.last_review = *t;
    }

    auto due = Date::parseIso(next);
    auto createdAt = parseTimestamp(created);
    if (!due || !createdAt) {
        spdlog::error("Bad date field in card '{}'", id);
        return false;
    }
    card.next_review = *due;
    card.created_at = *createdAt;
    return true;
}

} // namespace

EncryptedCardStore::EncryptedCardStore(std::string file, std::vector<unsigned char> k, Clock clk)
    : filename(std::move(file)), key(std::move(k)), clock(std::move(clk))
{
    if (!clock) {
        clock = [] { return std::time(nullptr); };
    }
    spdlog::debug("EncryptedCardStore bound to '{}'", filename);
}

EncryptedCardStore::~EncryptedCardStore() {
    if (!key.empty())
        sodium_memzero(key.data(), key.size());
}

bool EncryptedCardStore::open() {
    std::string plain;
    bool found = false;
    if (!Storage::readSealed(filename, MAGIC_HDR, key, plain, found)) {
        spdlog::error("Could not open card file '{}'", filename);
        return false;
    }

    std::vector<Card> loaded;
    bool ok = deserialize(plain, loaded);
    sodium_memzero(&plain[0], plain.size());
    if (!ok) {
        spdlog::error("Card file '{}' is corrupt", filename);
        return false;
    }

    cards = std::move(loaded);
    spdlog::info("Loaded {} cards from '{}'", cards.size(), filename);
    return true;
}

std::string EncryptedCardStore::create(const std::string& question, const std::string& answer) {
    Card card = Card::create(question, answer, clock());
    card.id = Card::generateID();

    cards.push_back(card);
    if (!persist()) {
        cards.pop_back();
        throw std::runtime_error("failed to persist new card to '" + filename + "'");
    }

    spdlog::info("Created card ID={} due {}", card.id, card.next_review.toIsoString());
    notify();
    return card.id;
}

std::vector<Card> EncryptedCardStore::readAll() const {
    return cards;
}

StoreStatus EncryptedCardStore::update(const std::string& id, const CardPatch& patch) {
    validatePatch(patch);

    auto it = find(id);
    if (it == cards.end()) {
        spdlog::warn("update: card {} not found", id);
        return StoreStatus::NOT_FOUND;
    }

    const Card before = *it;
    if (patch.interval) it->interval = *patch.interval;
    if (patch.ease_factor) it->ease_factor = *patch.ease_factor;
    if (patch.last_review) it->last_review = *patch.last_review;
    if (patch.next_review) it->next_review = *patch.next_review;

    if (!persist()) {
        *it = before;
        return StoreStatus::PERSISTENCE_ERROR;
    }

    spdlog::debug("Updated card {}", id);
    notify();
    return StoreStatus::OK;
}

StoreStatus EncryptedCardStore::remove(const std::string& id) {
    auto it = find(id);
    if (it == cards.end()) {
        spdlog::warn("remove: card {} not found", id);
        return StoreStatus::NOT_FOUND;
    }

    const auto index = std::distance(cards.begin(), it);
    Card removed = *it;
    cards.erase(it);

    if (!persist()) {
        cards.insert(cards.begin() + index, removed);
        return StoreStatus::PERSISTENCE_ERROR;
    }

    spdlog::info("Deleted card {}", id);
    notify();
    return StoreStatus::OK;
}

CardStore::SubscriptionId EncryptedCardStore::subscribe(Listener onChange) {
    SubscriptionId id = next_subscription++;
    listeners.emplace(id, std::move(onChange));
    return id;
}

void EncryptedCardStore::unsubscribe(SubscriptionId id) {
    listeners.erase(id);
}

bool EncryptedCardStore::persist() const {
    std::string plain = serialize(cards);
    bool ok = Storage::writeSealed(filename, MAGIC_HDR, plain, key);
    sodium_memzero(&plain[0], plain.size());
    if (!ok)
        spdlog::error("Failed to persist {} cards to '{}'", cards.size(), filename);
    return ok;
}

void EncryptedCardStore::notify() const {
    // The mutation is already on disk; a failing listener must not turn it into an error
    for (const auto& entry : listeners) {
        try {
            entry.second(cards);
        }
        catch (const std::exception& e) {
            spdlog::error("Card store listener {} failed: {}", entry.first, e.what());
        }
    }
}

std::vector<Card>::iterator EncryptedCardStore::find(const std::string& id) {
    return std::find_if(cards.begin(), cards.end(),
        [&id](const Card& c) { return c.id == id; });
}

std::string EncryptedCardStore::serialize(const std::vector<Card>& all) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto& c : all) {
        oss << c.id << "\n"
            << escapeText(c.question) << "\n"
            << escapeText(c.answer) << "\n"
            << c.interval << "\n"
            << c.ease_factor << "\n"
            << (c.last_review ? formatTimestamp(*c.last_review) : std::string(NO_REVIEW)) << "\n"
            << c.next_review.toIsoString() << "\n"
            << formatTimestamp(c.created_at) << "\n"
            << RECORD_END << "\n";
    }

    return oss.str();
}

bool EncryptedCardStore::deserialize(const std::string& plain, std::vector<Card>& out) {
    std::istringstream iss(plain);
    out.clear();

    std::string id;
    while (std::getline(iss, id)) {
        if (id.empty()) {
            spdlog::error("Empty card id in record {}", out.size() + 1);
            return false;
        }

        Card card;
        if (!parseRecord(iss, id, card)) return false;
        out.push_back(card);
    }

    return true;
}
