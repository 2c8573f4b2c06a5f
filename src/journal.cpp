// =============================================================================
// journal.cpp - Checkpoint/commit/revert fan-out
// =============================================================================

#include "cellar/journal.hpp"
#include <algorithm>

namespace cellar {

bool Journal::attach(Journaled* participant) {
    if (participant == nullptr || depth_ != 0) return false;
    if (std::find(participants_.begin(), participants_.end(), participant) != participants_.end()) {
        return true;
    }
    participants_.push_back(participant);
    return true;
}

void Journal::detach(Journaled* participant) {
    participants_.erase(std::remove(participants_.begin(), participants_.end(), participant),
                        participants_.end());
}

void Journal::checkpoint() {
    for (auto* p : participants_) p->checkpoint();
    ++depth_;
}

void Journal::commit() {
    if (depth_ == 0) return;
    for (auto* p : participants_) p->commit();
    --depth_;
}

void Journal::revert() {
    if (depth_ == 0) return;
    for (auto* p : participants_) p->revert();
    --depth_;
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(Journal& journal) : journal_(journal) {
    journal_.checkpoint();
}

Transaction::~Transaction() {
    if (!done_) journal_.revert();
}

void Transaction::commit() {
    if (done_) return;
    journal_.commit();
    done_ = true;
}

} // namespace cellar
