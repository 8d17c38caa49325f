// File: src/vm/Machine.hpp
// Purpose: Interpreter for lowered Kiln IR over a simulated byte-addressed heap.
// Key invariants: Executes only low-level opcodes; object-model opcodes trap.
//                 The heap is little endian and every access must fall inside
//                 a live allocation or a vtable.
// Ownership/Lifetime: Borrows the module, which must outlive the machine.
// Links: docs/lowering.md
#pragma once

#include "ir/core/Type.hpp"
#include "ir/core/fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln::vm
{

/// @brief Raised when executed code reaches a runtime trap.
class Trap : public std::runtime_error
{
  public:
    explicit Trap(const std::string &message) : std::runtime_error(message) {}
};

/// @brief Runtime value of one IR temporary.
struct Slot
{
    /// Integers, booleans and addresses, zero-extended to 64 bits.
    uint64_t bits = 0;
    double f64 = 0.0;
    std::string str;

    /// Components of a multi-value result.
    std::vector<Slot> agg;

    static Slot fromInt(int64_t v)
    {
        Slot s;
        s.bits = static_cast<uint64_t>(v);
        return s;
    }

    static Slot fromFloat(double v)
    {
        Slot s;
        s.f64 = v;
        return s;
    }

    [[nodiscard]] int64_t i64() const
    {
        return static_cast<int64_t>(bits);
    }
};

class Machine
{
  public:
    using ExternFn = std::function<Slot(const std::vector<Slot> &)>;

    /// Called for every store with its address and width in bytes.
    using StoreHook = std::function<void(uint64_t address, unsigned bytes)>;

    struct Allocation
    {
        uint64_t address = 0;
        uint64_t bytes = 0;
    };

    explicit Machine(const core::Module &module, unsigned pointerBytes = 8);

    /// @brief Execute function @p name with @p args.
    /// @throws Trap on runtime traps, bad memory accesses and unknown symbols.
    Slot run(const std::string &name, const std::vector<Slot> &args = {});

    /// @brief Provide the implementation of extern @p name.
    void registerExtern(const std::string &name, ExternFn fn);

    void setStoreHook(StoreHook hook)
    {
        storeHook_ = std::move(hook);
    }

    [[nodiscard]] uint64_t storeCount() const
    {
        return storeCount_;
    }

    void resetStoreCount()
    {
        storeCount_ = 0;
    }

    void setStepLimit(uint64_t limit)
    {
        stepLimit_ = limit;
    }

    /// @brief Raw bytes at [@p address, @p address + @p count).
    std::vector<uint8_t> readBytes(uint64_t address, size_t count) const;

    /// @brief Little-endian unsigned integer of @p bytes bytes at @p address.
    uint64_t readWord(uint64_t address, unsigned bytes) const;

    /// @brief Address of the materialized vtable named @p symbol.
    uint64_t vtableAddress(const std::string &symbol) const;

    /// @brief Address standing for the entry of function @p name.
    uint64_t functionAddress(const std::string &name) const;

    /// @brief Every allocation made through kiln_alloc, in order.
    [[nodiscard]] const std::vector<Allocation> &allocations() const
    {
        return allocations_;
    }

    /// Byte written into memory that an allocation leaves uninitialized.
    static constexpr uint8_t kGarbageByte = 0xA5;

  private:
    struct Frame
    {
        const core::Function *fn = nullptr;
        std::unordered_map<unsigned, Slot> temps;
    };

    const core::Module &module_;
    unsigned pointerBytes_;
    std::vector<uint8_t> heap_;
    std::map<uint64_t, uint64_t> regions_;
    std::vector<Allocation> allocations_;
    std::unordered_map<std::string, const core::Function *> functions_;
    std::unordered_map<std::string, uint64_t> functionAddrs_;
    std::unordered_map<uint64_t, const core::Function *> functionsByAddr_;
    std::unordered_map<std::string, uint64_t> labelAddrs_;
    std::unordered_map<uint64_t, std::string> labelsByAddr_;
    std::unordered_map<std::string, uint64_t> vtables_;
    std::unordered_map<std::string, ExternFn> externs_;
    StoreHook storeHook_;
    uint64_t storeCount_ = 0;
    uint64_t steps_ = 0;
    uint64_t stepLimit_ = 10'000'000;

    uint64_t allocate(uint64_t bytes, bool zero);
    void checkRange(uint64_t address, uint64_t bytes) const;
    uint64_t addressMask() const;

    uint64_t loadRaw(uint64_t address, unsigned bytes) const;
    void storeRaw(uint64_t address, unsigned bytes, uint64_t value);
    Slot loadTyped(core::Type type, uint64_t address, uint8_t bit) const;
    void storeTyped(core::Type type, uint64_t address, uint8_t bit, const Slot &value);

    void materializeVTables();
    uint64_t labelAddress(const std::string &function, const std::string &label) const;

    Slot eval(const Frame &fr, const core::Value &v) const;
    Slot call(const std::string &callee, const std::vector<Slot> &args);
    Slot callFunction(const core::Function &fn, const std::vector<Slot> &args);
    Slot callAddress(uint64_t address, const std::vector<Slot> &args);
};

} // namespace kiln::vm
