#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// ErrorKind - closed classification of every failure a command can report
// -----------------------------------------------------------------------------
//
// @brief  One value per exception class below. The IPC dispatcher maps the
//         kind to the "error" field of its JSON reply, so callers can branch
//         on it without parsing messages.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Validation,
  NotFound,
  InsufficientStock,
  InvalidStateTransition,
  ConcurrencyConflict,
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:             return "ValidationError";
    case ErrorKind::NotFound:               return "NotFoundError";
    case ErrorKind::InsufficientStock:      return "InsufficientStockError";
    case ErrorKind::InvalidStateTransition: return "InvalidStateTransitionError";
    case ErrorKind::ConcurrencyConflict:    return "ConcurrencyConflictError";
  }
  return "UnknownError";
}

// -----------------------------------------------------------------------------
// EngineError - base of the engine's exception taxonomy
// -----------------------------------------------------------------------------
//
// @details
// Commands either return a success payload or throw exactly one EngineError
// subclass. Nothing is committed when one escapes a command handler: every
// mutation is staged in a UnitOfWork that is discarded on unwind.
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& message)
      : std::runtime_error(message) {}

  virtual ErrorKind kind() const = 0;
};

// Malformed or out-of-range input. Raised before any mutation is staged.
class ValidationError : public EngineError {
 public:
  explicit ValidationError(const std::string& message)
      : EngineError(message) {}

  ErrorKind kind() const override { return ErrorKind::Validation; }
};

// Unknown order / BOM / product / warehouse / lot / batch reference.
class NotFoundError : public EngineError {
 public:
  explicit NotFoundError(const std::string& message) : EngineError(message) {}

  ErrorKind kind() const override { return ErrorKind::NotFound; }
};

// -----------------------------------------------------------------------------
// InsufficientStockError
// -----------------------------------------------------------------------------
//
// @brief  FEFO could not fully satisfy one requirement line. Carries the
//         material, warehouse, requested and available quantities so the
//         caller can report the shortfall.
// -----------------------------------------------------------------------------
class InsufficientStockError : public EngineError {
 public:
  InsufficientStockError(const std::string& message,
                         std::uint64_t material_id,
                         std::uint64_t warehouse_id,
                         double requested,
                         double available)
      : EngineError(message),
        material_id_(material_id),
        warehouse_id_(warehouse_id),
        requested_(requested),
        available_(available) {}

  ErrorKind kind() const override { return ErrorKind::InsufficientStock; }

  std::uint64_t materialId() const { return material_id_; }
  std::uint64_t warehouseId() const { return warehouse_id_; }
  double requested() const { return requested_; }
  double available() const { return available_; }
  double shortfall() const { return requested_ - available_; }

 private:
  std::uint64_t material_id_;
  std::uint64_t warehouse_id_;
  double requested_;
  double available_;
};

// Command not legal for the current order (or BOM) status.
class InvalidStateTransitionError : public EngineError {
 public:
  explicit InvalidStateTransitionError(const std::string& message)
      : EngineError(message) {}

  ErrorKind kind() const override {
    return ErrorKind::InvalidStateTransition;
  }
};

// Optimistic version check failed on every permitted attempt.
class ConcurrencyConflictError : public EngineError {
 public:
  explicit ConcurrencyConflictError(const std::string& message)
      : EngineError(message) {}

  ErrorKind kind() const override { return ErrorKind::ConcurrencyConflict; }
};

}  // namespace mfg
