/**
 * @file event.hpp
 * @brief Event identification for reactive trees.
 *
 * Every event exposes a stable name and an EventKind, a 64-bit FNV-1a
 * fingerprint of that name. Reactive nodes declare interest in kinds and
 * compare them for equality only; kinds are never used to recover the
 * payload of an event.
 *
 * Fingerprints are not collision-free: two distinct names map to the same
 * kind with a probability of about 2^-64 per pair. Behavior on such a
 * collision is unspecified; the two event types are indistinguishable to
 * every node. Give events distinct names (BHV_MARKER_EVENT_NAMED can
 * qualify a type name with its namespace) to stay clear of it.
 *
 * Works with -fno-rtti: marker event names come from the declared type
 * name captured by BHV_MARKER_EVENT, not from typeid.
 */

#ifndef BHV_EVENT_HPP_
#define BHV_EVENT_HPP_

#include <cstdint>

namespace bhv {

// ============================================================================
// EventKind
// ============================================================================

/**
 * @brief Opaque, equality-only fingerprint of an event's logical type.
 */
class EventKind final {
 public:
  constexpr explicit EventKind(uint64_t value) noexcept : value_(value) {}

  /**
   * @brief Fingerprint a canonical event name.
   * @param name Null-terminated name; nullptr hashes like "".
   */
  static constexpr EventKind FromName(const char* name) noexcept {
    return EventKind(Fnv1a64(name));
  }

  /** @brief Raw 64-bit fingerprint. */
  constexpr uint64_t value() const noexcept { return value_; }

  friend constexpr bool operator==(EventKind a, EventKind b) noexcept {
    return a.value_ == b.value_;
  }

  friend constexpr bool operator!=(EventKind a, EventKind b) noexcept {
    return a.value_ != b.value_;
  }

 private:
  static constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
  static constexpr uint64_t kFnvPrime = 1099511628211ULL;

  static constexpr uint64_t Fnv1a64(const char* s) noexcept {
    uint64_t hash = kFnvOffsetBasis;
    if (s != nullptr) {
      for (; *s != '\0'; ++s) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(*s));
        hash *= kFnvPrime;
      }
    }
    return hash;
  }

  uint64_t value_;
};

// ============================================================================
// Event
// ============================================================================

/**
 * @brief Base class of every event fed to a reactive tree.
 *
 * Value-dependent events (enum-like events whose variants must be told
 * apart) override name() to return the variant's name. kind() hashes
 * name() on every call unless a subclass caches it (see NamedEvent and
 * MarkerEvent).
 */
class Event {
 public:
  virtual ~Event() = default;

  /** @brief Canonical name of this event's logical type. */
  virtual const char* name() const noexcept = 0;

  /** @brief Fingerprint of name(). */
  virtual EventKind kind() const noexcept {
    return EventKind::FromName(name());
  }

 protected:
  Event() noexcept = default;
  Event(const Event&) noexcept = default;
  Event& operator=(const Event&) noexcept = default;
};

/**
 * @brief Base for marker events, whose identity is their type alone.
 * @tparam Derived Event type providing
 *         `static constexpr const char* TypeName() noexcept`.
 *
 * The kind is computed at compile time and available without an instance
 * through StaticKind().
 */
template <typename Derived>
class MarkerEvent : public Event {
 public:
  static constexpr EventKind StaticKind() noexcept {
    return EventKind::FromName(Derived::TypeName());
  }

  const char* name() const noexcept override { return Derived::TypeName(); }

  EventKind kind() const noexcept override { return StaticKind(); }
};

/**
 * @brief Event carrying a runtime name, fingerprinted once on construction.
 * @param name Event name (must have static lifetime).
 */
class NamedEvent : public Event {
 public:
  explicit NamedEvent(const char* name) noexcept
      : name_(name), kind_(EventKind::FromName(name)) {}

  const char* name() const noexcept override { return name_; }

  EventKind kind() const noexcept override { return kind_; }

 private:
  const char* name_;
  EventKind kind_;
};

}  // namespace bhv

/**
 * @brief Declare a marker event type named after the type itself.
 *
 * @code
 * BHV_MARKER_EVENT(Exit);
 * @endcode
 */
#define BHV_MARKER_EVENT(Type) BHV_MARKER_EVENT_NAMED(Type, #Type)

/** @brief Declare a marker event type with an explicit canonical name. */
#define BHV_MARKER_EVENT_NAMED(Type, Name)                     \
  struct Type final : public ::bhv::MarkerEvent<Type> {        \
    static constexpr const char* TypeName() noexcept {         \
      return Name;                                             \
    }                                                          \
  }

namespace bhv {

/// Payload-free event, handy for driving reactive trees like polled ones.
BHV_MARKER_EVENT(UnitEvent);

// ============================================================================
// Event sources
// ============================================================================

/**
 * @brief Pull-based source of events for the reactive drivers.
 */
class EventPump {
 public:
  virtual ~EventPump() = default;

  /** @brief Next event, or nullptr once the source is exhausted. */
  virtual const Event* Next() noexcept = 0;
};

/**
 * @brief Endless source of UnitEvent.
 */
class UnitEventPump final : public EventPump {
 public:
  const Event* Next() noexcept override { return &event_; }

 private:
  UnitEvent event_;
};

}  // namespace bhv

#endif  // BHV_EVENT_HPP_
