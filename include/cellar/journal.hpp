#ifndef CELLAR_JOURNAL_HPP
#define CELLAR_JOURNAL_HPP

#include <cstddef>
#include <utility>
#include <vector>

namespace cellar {

// =============================================================================
// Journaled - participant in an all-or-nothing state transition
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;

    virtual void checkpoint() = 0;  // push a restore point
    virtual void commit() = 0;      // drop the latest restore point
    virtual void revert() = 0;      // restore and drop the latest restore point
};

// Copy-on-checkpoint state holder. State must be copyable.
template <typename State>
class JournaledState : public Journaled {
public:
    void checkpoint() override { saved_.push_back(state_); }

    void commit() override {
        if (!saved_.empty()) saved_.pop_back();
    }

    void revert() override {
        if (saved_.empty()) return;
        state_ = std::move(saved_.back());
        saved_.pop_back();
    }

    size_t checkpoint_depth() const { return saved_.size(); }

protected:
    State state_{};

private:
    std::vector<State> saved_;
};

// =============================================================================
// Journal - fans checkpoints out to every attached participant
// =============================================================================

class Journal {
public:
    Journal() = default;

    // Non-copyable
    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // Participants can only join while no transaction is open
    bool attach(Journaled* participant);
    void detach(Journaled* participant);

    void checkpoint();
    void commit();
    void revert();

    size_t depth() const { return depth_; }
    size_t participants() const { return participants_.size(); }

private:
    std::vector<Journaled*> participants_;
    size_t depth_{0};
};

// =============================================================================
// Transaction - RAII scope, reverts unless committed
// =============================================================================

class Transaction {
public:
    explicit Transaction(Journal& journal);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Journal& journal_;
    bool done_{false};
};

} // namespace cellar

#endif // CELLAR_JOURNAL_HPP
