#pragma once
#include <ctime>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "CardStore.hpp"

/*
  Card collection of one user, kept in memory and written through to a
  sealed file on every mutation. If the write fails the mutation is undone
  and PERSISTENCE_ERROR is returned.

  Plaintext record (one field per line, text fields escaped):
    id / question / answer / interval / ease_factor /
    last_review (ISO timestamp or "-") / next_review (ISO date) / created_at / ---
*/
class EncryptedCardStore : public CardStore {
public:
    using Clock = std::function<std::time_t()>;

    EncryptedCardStore(std::string filename, std::vector<unsigned char> key, Clock clock = nullptr);
    ~EncryptedCardStore() override;

    // Loads the file. A missing file is an empty collection.
    bool open();

    std::string create(const std::string& question, const std::string& answer) override;
    std::vector<Card> readAll() const override;
    StoreStatus update(const std::string& id, const CardPatch& patch) override;
    StoreStatus remove(const std::string& id) override;

    SubscriptionId subscribe(Listener onChange) override;
    void unsubscribe(SubscriptionId id) override;

    const std::string& path() const { return filename; }

    static std::string serialize(const std::vector<Card>& all);
    static bool deserialize(const std::string& plain, std::vector<Card>& out);

private:
    std::string filename;
    std::vector<unsigned char> key;
    Clock clock;

    std::vector<Card> cards;   // insertion order
    std::map<SubscriptionId, Listener> listeners;
    SubscriptionId next_subscription = 1;

    bool persist() const;
    void notify() const;
    std::vector<Card>::iterator find(const std::string& id);
};
