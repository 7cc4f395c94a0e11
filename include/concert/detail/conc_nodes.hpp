#pragma once

#include "conc_runner.hpp"
#include "first_wins_slot.hpp"
#include "../task_handle.hpp"
#include "../profiling.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

namespace concert {

inline namespace v1 {

/**
 * @brief      Failure raised when a race runs out of alternatives.
 *
 * This is raised by evaluating an empty alternative (see conc_empty()). As the empty alternative is
 * the identity of the race operation, this can only escape a race if all its failing branches
 * failed with it. If any branch failed with a real exception, the real exception is reported.
 */
struct empty_with_no_alternative : std::runtime_error {
    empty_with_no_alternative()
        : std::runtime_error("empty alternative with no alternative available") {}
};

} // namespace v1

namespace detail {

//! A node in a conc tree. Nodes are immutable; starting a node creates a new branch.
template <typename T>
struct conc_node {
    virtual ~conc_node() = default;

    //! Starts the evaluation of this node. Must be called on the coordinator thread.
    //! The outcome is reported to `sink`, either from within this call or later, from an event.
    //! Returns the live state of the evaluation; null if nothing needs to be cancelled.
    virtual branch_ptr start(conc_runner& r, result_sink<T>& sink) const = 0;
};

template <typename T>
using node_ptr = std::shared_ptr<const conc_node<T>>;

//! A value, available without spawning anything
template <typename T>
struct pure_node : conc_node<T> {
    explicit pure_node(T val)
        : value_(std::move(val)) {}

    branch_ptr start(conc_runner& /*r*/, result_sink<T>& sink) const override {
        sink.on_value(T(value_));
        return {};
    }

    T value_;
};

//! The empty alternative; always fails with empty_with_no_alternative
template <typename T>
struct empty_node : conc_node<T> {
    branch_ptr start(conc_runner& /*r*/, result_sink<T>& sink) const override {
        sink.on_failure(conc_failure{std::make_exception_ptr(empty_with_no_alternative{}), true});
        return {};
    }
};

//! The state of a leaf: one task
template <typename T>
struct leaf_branch : branch {
    explicit leaf_branch(result_sink<T>& sink)
        : sink_(sink) {}

    void request_cancel() override {
        settled_ = true;
        handle_.request_cancel();
    }
    void await_stopped() override { handle_.cancel(); }

    //! Called on the coordinator thread after the task is done
    void on_task_done() {
        if (settled_)
            return;
        settled_ = true;
        CONCERT_PROFILING_SCOPE_N("leaf done");
        std::optional<T> val;
        std::exception_ptr ex;
        try {
            val.emplace(handle_.join());
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex)
            sink_.on_failure(conc_failure{ex});
        else
            sink_.on_value(std::move(*val));
    }

    result_sink<T>& sink_;
    task_handle<T> handle_;
    //! Set when the outcome of the task is no longer of interest
    bool settled_{false};
};

//! One unit of work, executed in its own task
template <typename T>
struct leaf_node : conc_node<T> {
    explicit leaf_node(std::function<T()> fun)
        : fun_(std::move(fun)) {}

    branch_ptr start(conc_runner& r, result_sink<T>& sink) const override {
        CONCERT_PROFILING_SCOPE_N("leaf start");
        auto b = std::make_unique<leaf_branch<T>>(sink);
        auto* raw = b.get();
        // The notification is processed by the coordinator, i.e., after we return from here
        raw->handle_ = spawn(fun_, r.make_notifier([raw] { raw->on_task_done(); }));
        return b;
    }

    std::function<T()> fun_;
};

//! The state of an AND-combination: both sides need to succeed
template <typename T, typename A, typename B>
struct zip_branch : branch {
    zip_branch(conc_runner& r, result_sink<T>& sink, const std::function<T(A, B)>& combine)
        : runner_(r)
        , sink_(sink)
        , combine_(combine) {}

    struct left_sink : result_sink<A> {
        explicit left_sink(zip_branch& self)
            : self_(self) {}
        void on_value(A&& val) override {
            if (self_.decided_)
                return;
            self_.left_val_.emplace(std::move(val));
            self_.try_combine();
        }
        void on_failure(conc_failure f) override { self_.fail(std::move(f), self_.right_); }
        zip_branch& self_;
    };
    struct right_sink : result_sink<B> {
        explicit right_sink(zip_branch& self)
            : self_(self) {}
        void on_value(B&& val) override {
            if (self_.decided_)
                return;
            self_.right_val_.emplace(std::move(val));
            self_.try_combine();
        }
        void on_failure(conc_failure f) override { self_.fail(std::move(f), self_.left_); }
        zip_branch& self_;
    };

    void request_cancel() override {
        decided_ = true;
        if (left_)
            left_->request_cancel();
        if (right_)
            right_->request_cancel();
    }
    void await_stopped() override {
        if (left_)
            left_->await_stopped();
        if (right_)
            right_->await_stopped();
    }

    //! Called when one of the sides produced a value
    void try_combine() {
        if (!left_val_ || !right_val_)
            return;
        decided_ = true;
        std::optional<T> res;
        std::exception_ptr ex;
        try {
            res.emplace(combine_(std::move(*left_val_), std::move(*right_val_)));
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex)
            sink_.on_failure(conc_failure{ex});
        else
            sink_.on_value(std::move(*res));
    }

    //! Called when one of the sides failed; the first failure wins, the other side is cancelled.
    //! The failure is reported right away, so that the ancestors can cancel their other branches
    //! too; the coordinator waits for the cancelled branches afterwards.
    void fail(conc_failure f, branch_ptr& other) {
        if (decided_ || !failure_.try_set(std::move(f)))
            return;
        decided_ = true;
        CONCERT_PROFILING_SCOPE_NC("zip failed", CONCERT_PROFILING_COLOR_RED);
        runner_.retire(other.get());
        sink_.on_failure(failure_.get());
    }

    conc_runner& runner_;
    result_sink<T>& sink_;
    const std::function<T(A, B)>& combine_;
    left_sink left_sink_{*this};
    right_sink right_sink_{*this};
    branch_ptr left_;
    branch_ptr right_;
    std::optional<A> left_val_;
    std::optional<B> right_val_;
    first_wins_slot<conc_failure> failure_;
    //! Set once the outcome was reported (or the branch was cancelled)
    bool decided_{false};
};

//! AND-combination of two trees
template <typename T, typename A, typename B>
struct zip_node : conc_node<T> {
    zip_node(node_ptr<A> left, node_ptr<B> right, std::function<T(A, B)> combine)
        : left_(std::move(left))
        , right_(std::move(right))
        , combine_(std::move(combine)) {}

    branch_ptr start(conc_runner& r, result_sink<T>& sink) const override {
        auto b = std::make_unique<zip_branch<T, A, B>>(r, sink, combine_);
        b->left_ = left_->start(r, b->left_sink_);
        // If the left side already failed, there is no point in starting the right side
        if (!b->decided_)
            b->right_ = right_->start(r, b->right_sink_);
        return b;
    }

    node_ptr<A> left_;
    node_ptr<B> right_;
    std::function<T(A, B)> combine_;
};

//! The state of an OR-combination: the first side to succeed wins
template <typename T>
struct race_branch : branch {
    race_branch(conc_runner& r, result_sink<T>& sink)
        : runner_(r)
        , sink_(sink) {}

    struct side_sink : result_sink<T> {
        side_sink(race_branch& self, branch_ptr& other)
            : self_(self)
            , other_(other) {}
        void on_value(T&& val) override { self_.win(std::move(val), other_); }
        void on_failure(conc_failure f) override { self_.eliminate(std::move(f)); }
        race_branch& self_;
        branch_ptr& other_;
    };

    void request_cancel() override {
        decided_ = true;
        if (left_)
            left_->request_cancel();
        if (right_)
            right_->request_cancel();
    }
    void await_stopped() override {
        if (left_)
            left_->await_stopped();
        if (right_)
            right_->await_stopped();
    }

    //! Called when one side succeeded; the other side is cancelled (and awaited later)
    void win(T&& val, branch_ptr& other) {
        if (decided_)
            return;
        decided_ = true;
        CONCERT_PROFILING_SCOPE_NC("race won", CONCERT_PROFILING_COLOR_LIME);
        runner_.retire(other.get());
        sink_.on_value(std::move(val));
    }

    //! Called when one side failed; the race fails only after both sides failed
    void eliminate(conc_failure f) {
        if (decided_)
            return;
        if (f.no_alternative_)
            empty_failure_.try_set(std::move(f));
        else
            real_failure_.try_set(std::move(f));
        if (++num_failed_ < 2)
            return;
        decided_ = true;
        sink_.on_failure(real_failure_.is_set() ? real_failure_.get() : empty_failure_.get());
    }

    conc_runner& runner_;
    result_sink<T>& sink_;
    branch_ptr left_;
    branch_ptr right_;
    side_sink left_sink_{*this, right_};
    side_sink right_sink_{*this, left_};
    //! The first failure with a real exception
    first_wins_slot<conc_failure> real_failure_;
    //! The first empty-alternative failure
    first_wins_slot<conc_failure> empty_failure_;
    int num_failed_{0};
    //! Set once the outcome was reported (or the branch was cancelled)
    bool decided_{false};
};

//! OR-combination of two trees
template <typename T>
struct race_node : conc_node<T> {
    race_node(node_ptr<T> left, node_ptr<T> right)
        : left_(std::move(left))
        , right_(std::move(right)) {}

    branch_ptr start(conc_runner& r, result_sink<T>& sink) const override {
        auto b = std::make_unique<race_branch<T>>(r, sink);
        b->left_ = left_->start(r, b->left_sink_);
        // If the left side already has a value, it wins; don't start the right side
        if (!b->decided_)
            b->right_ = right_->start(r, b->right_sink_);
        return b;
    }

    node_ptr<T> left_;
    node_ptr<T> right_;
};

//! The sink at the top of the tree; holds the outcome of run_conc()
template <typename T>
struct root_sink : result_sink<T> {
    void on_value(T&& val) override {
        value_.emplace(std::move(val));
        done_ = true;
    }
    void on_failure(conc_failure f) override {
        error_ = f.ex_;
        done_ = true;
    }

    //! Returns the value, or throws the error
    T take() {
        if (error_)
            std::rethrow_exception(error_);
        return std::move(*value_);
    }

    std::optional<T> value_;
    std::exception_ptr error_;
    bool done_{false};
};

} // namespace detail
} // namespace concert
