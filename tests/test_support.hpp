// Scripted nodes shared by the unit tests.

#ifndef BHV_TESTS_TEST_SUPPORT_HPP_
#define BHV_TESTS_TEST_SUPPORT_HPP_

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>

#include <bhv/bhv.hpp>

namespace bhv_test {

/**
 * @brief Observable state of a scripted node, owned by the test.
 *
 * Each step returns the next scripted status; the last one repeats.
 * Reset() rewinds the script.
 */
struct Probe {
  Probe(std::initializer_list<bhv::Status> statuses, int probe_id = 0,
        std::vector<int>* trace_log = nullptr)
      : script(statuses), id(probe_id), trace(trace_log) {}

  bhv::Status Step() {
    ++steps;
    if (trace != nullptr) {
      trace->push_back(id);
    }
    const std::size_t i = (pos < script.size()) ? pos : script.size() - 1;
    ++pos;
    return script[i];
  }

  void Rewind(bhv::Status status) {
    ++resets;
    last_reset = status;
    pos = 0;
  }

  std::vector<bhv::Status> script;
  int id;
  std::vector<int>* trace;
  std::size_t pos = 0;
  int steps = 0;
  int resets = 0;
  bhv::Status last_reset = bhv::Status::kRunning;
};

template <typename Context>
class ProbeNode final : public bhv::Node<Context> {
 public:
  explicit ProbeNode(Probe* probe) noexcept : probe_(probe) {}

  bhv::Status Tick(Context& /*ctx*/) override { return probe_->Step(); }

  void Reset(bhv::Status last_status) noexcept override {
    probe_->Rewind(last_status);
  }

  bhv::NodeType type() const noexcept override {
    return bhv::NodeType::kAsyncAction;
  }

 private:
  Probe* probe_;
};

/// Reactive probe; with a kind set it only accepts events of that kind.
template <typename Context>
class ReactiveProbeNode final : public bhv::reactive::Node<Context> {
 public:
  explicit ReactiveProbeNode(Probe* probe) noexcept
      : probe_(probe), filtered_(false), kind_(0) {}

  ReactiveProbeNode(Probe* probe, bhv::EventKind kind) noexcept
      : probe_(probe), filtered_(true), kind_(kind) {}

  bool InterestedIn(bhv::EventKind kind) const noexcept override {
    return !filtered_ || (kind == kind_);
  }

  bhv::Status React(const bhv::Event& /*event*/, Context& /*ctx*/) override {
    return probe_->Step();
  }

  void Reset(bhv::Status last_status) noexcept override {
    probe_->Rewind(last_status);
  }

  bhv::NodeType type() const noexcept override {
    return bhv::NodeType::kAsyncAction;
  }

 private:
  Probe* probe_;
  bool filtered_;
  bhv::EventKind kind_;
};

template <typename Context>
bhv::NodePtr<Context> MakeProbe(Probe* probe) {
  return std::make_unique<ProbeNode<Context>>(probe);
}

template <typename Context>
bhv::reactive::NodePtr<Context> MakeReactiveProbe(Probe* probe) {
  return std::make_unique<ReactiveProbeNode<Context>>(probe);
}

template <typename Context>
bhv::reactive::NodePtr<Context> MakeReactiveProbe(Probe* probe,
                                                  bhv::EventKind kind) {
  return std::make_unique<ReactiveProbeNode<Context>>(probe, kind);
}

}  // namespace bhv_test

#endif  // BHV_TESTS_TEST_SUPPORT_HPP_
