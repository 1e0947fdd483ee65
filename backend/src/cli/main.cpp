#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <memory>
#include <stdexcept>

#include "../utils/config.hpp"
#include "../utils/logging.hpp"
#include "../auth/AuthManager.hpp"
#include "../core/Errors.hpp"
#include "../core/DueQueue.hpp"
#include "../core/ReviewSession.hpp"
#include "../storage/EncryptedCardStore.hpp"

static void discardLine() {
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

// Reads a menu number; -1 on bad input, 0 at end of input
static int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return 0;
        std::cin.clear();
        discardLine();
        return -1;
    }
    discardLine();
    return choice;
}

static std::string formatLastReview(const Card& c) {
    return c.last_review ? formatTimestamp(*c.last_review) : "Never";
}

static void listAllCards(const std::vector<Card>& cards) {
    std::cout << "\n===== ALL FLASHCARDS =====\n";

    if (cards.empty()) {
        std::cout << "No flashcards yet! Add your first flashcard.\n";
        return;
    }

    for (size_t i = 0; i < cards.size(); i++) {
        const Card& c = cards[i];
        std::cout << i + 1 << ". " << c.question << "\n";
        std::cout << "   Answer: " << c.answer << "\n";
        std::cout << "   Interval: " << c.interval << " days\n";
        std::cout << "   Ease: " << c.ease_factor << "\n";
        std::cout << "   Last review: " << formatLastReview(c) << "\n";
        std::cout << "   Next review: " << c.next_review.toIsoString().substr(0, 10) << "\n";
        std::cout << "-----------------------------\n";
    }
}

static int chooseCardIndex(const std::vector<Card>& cards) {
    if (cards.empty()) {
        std::cout << "No flashcards available.\n";
        return -1;
    }
    listAllCards(cards);
    std::cout << "Choose card number: ";

    int sel = readChoice();
    if (sel < 1 || static_cast<size_t>(sel) > cards.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

// 0..3 -> Again/Hard/Good/Easy, -1 to abort the session
static int askQuality() {
    while (true) {
        std::cout << "\nHow well did you recall it?\n"
            " 1 = Again\n"
            " 2 = Hard\n"
            " 3 = Good\n"
            " 4 = Easy\n"
            " 0 = Stop reviewing\n> ";
        switch (readChoice()) {
        case 1: return static_cast<int>(ReviewQuality::AGAIN);
        case 2: return static_cast<int>(ReviewQuality::HARD);
        case 3: return static_cast<int>(ReviewQuality::GOOD);
        case 4: return static_cast<int>(ReviewQuality::EASY);
        case 0: return -1;
        default: std::cout << "Invalid input.\n";
        }
    }
}

static void addCard(CardStore& store) {
    std::string question, answer;
    std::cout << "Enter question: "; std::getline(std::cin, question);
    std::cout << "Enter answer: "; std::getline(std::cin, answer);

    try {
        store.create(question, answer);
        std::cout << "Flashcard added.\n";
    }
    catch (const InvalidInput&) {
        std::cout << "Question and Answer cannot be empty.\n";
    }
    catch (const std::runtime_error& e) {
        std::cout << "Failed to add flashcard: " << e.what() << "\n";
    }
}

static void deleteCard(CardStore& store) {
    std::vector<Card> cards = store.readAll();
    int idx = chooseCardIndex(cards);
    if (idx < 0) return;

    switch (store.remove(cards[idx].id)) {
    case StoreStatus::OK: std::cout << "Flashcard deleted.\n"; break;
    case StoreStatus::NOT_FOUND: std::cout << "That flashcard no longer exists.\n"; break;
    case StoreStatus::PERSISTENCE_ERROR: std::cout << "Failed to delete flashcard. Please try again.\n"; break;
    }
}

static void review(CardStore& store) {
    ReviewSession session(store);
    session.start(buildDueQueue(store.readAll(), Date::today()));

    if (session.phase() == ReviewSession::Phase::COMPLETE) {
        std::cout << "No flashcards due for review today!\n"
            "Add new cards or check back later.\n";
        return;
    }

    while (session.phase() != ReviewSession::Phase::COMPLETE) {
        const Card& card = session.currentCard();
        std::cout << "\nCards Due: " << session.size()
            << " (Card " << session.position() + 1 << " of " << session.size() << ")\n"
            << "Q: " << card.question << "\n"
            << "[Press Enter to show the answer]";
        discardLine();

        session.revealAnswer();
        std::cout << "A: " << card.answer << "\n";

        while (session.phase() == ReviewSession::Phase::AWAITING_RATING) {
            int q = askQuality();
            if (q < 0) {
                session.abort();
                std::cout << "Review stopped. Ratings so far are saved.\n";
                return;
            }

            StoreStatus status = session.submitRating(q);
            if (status == StoreStatus::OK) {
                std::cout << "Next review: "
                    << session.lastOutcome()->next_review.toIsoString().substr(0, 10) << "\n";
            }
            else if (status == StoreStatus::NOT_FOUND) {
                std::cout << "This card was deleted elsewhere; choose 0 to stop.\n";
            }
            else {
                std::cout << "Failed to update flashcard review. Please try again.\n";
            }
        }
    }

    std::cout << "\nReview Complete! You have reviewed all due flashcards for today! ("
        << session.reviewedCount() << " reviewed, " << session.lapseCount() << " to relearn)\n";
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    const Config cfg = Config::fromEnvironment();
    Log::init(cfg);

    std::unique_ptr<AuthManager> auth;
    try {
        auth = std::make_unique<AuthManager>(cfg.userFile());
    }
    catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<UserSession> user;

    // LOGIN / SIGNUP
    while (!user) {
        std::cout << "\n===== LOGIN MENU =====\n"
            "1. Login\n"
            "2. Signup\n"
            "3. Exit\n> ";
        int choice = readChoice();
        if (!std::cin) return 0;

        if (choice == 1) {
            std::string username, password;
            std::cout << "Username: "; std::getline(std::cin, username);
            std::cout << "Password: "; std::getline(std::cin, password);

            user = auth->login(username, password);
            if (user) std::cout << "Login successful.\n";
            else std::cout << "Invalid username/password.\n";
        }
        else if (choice == 2) {
            std::string username, password;
            std::cout << "Choose username: "; std::getline(std::cin, username);
            std::cout << "Choose password: "; std::getline(std::cin, password);
            try {
                if (auth->signup(username, password)) std::cout << "Signup complete.\n";
                else std::cout << "Signup failed.\n";
            }
            catch (const InvalidInput& e) {
                std::cout << "Signup failed: " << e.what() << "\n";
            }
        }
        else if (choice == 3)
            return 0;
    }

    EncryptedCardStore store(cfg.cardFileFor(user->username()), user->key());
    if (!store.open()) {
        std::cout << "Failed to load flashcards. Please try again.\n";
        return 1;
    }
    store.subscribe([](const std::vector<Card>& cards) {
        spdlog::debug("Card store changed; {} card(s) stored", cards.size());
    });

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== FLASHCARDS =====\n"
            "User: " << user->username() << "\n"
            "1. Add Card\n"
            "2. Review Due Cards\n"
            "3. List All Cards\n"
            "4. Delete Card\n"
            "5. Exit\n> ";

        int choice = readChoice();
        if (!std::cin) break;

        if (choice == 1) addCard(store);
        else if (choice == 2) review(store);
        else if (choice == 3) listAllCards(store.readAll());
        else if (choice == 4) deleteCard(store);
        else if (choice == 5) break;
    }

    std::cout << "Goodbye!\n";
    return 0;
}
