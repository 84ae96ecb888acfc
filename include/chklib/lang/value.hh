#pragma once

#include <chklib/lang/ast.hh>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace chk::lang {

class Heap;
class Object;
struct ScopeInfo;

// Counted reference to a heap object
class ObjRef {
    Object* obj_ = nullptr;

public:
    ObjRef() noexcept = default;

    explicit ObjRef(Object* obj) noexcept;

    ObjRef(const ObjRef& other) noexcept : ObjRef{other.obj_} {}

    ObjRef(ObjRef&& other) noexcept : obj_{std::exchange(other.obj_, nullptr)} {}

    ObjRef& operator=(const ObjRef& other) noexcept {
        ObjRef{other}.swap(*this);
        return *this;
    }

    ObjRef& operator=(ObjRef&& other) noexcept {
        ObjRef{std::move(other)}.swap(*this);
        return *this;
    }

    ~ObjRef() { reset(); }

    void reset() noexcept;

    void swap(ObjRef& other) noexcept { std::swap(obj_, other.obj_); }

    [[nodiscard]] Object* get() const noexcept { return obj_; }

    Object& operator*() const noexcept { return *obj_; }

    Object* operator->() const noexcept { return obj_; }

    explicit operator bool() const noexcept { return obj_ != nullptr; }
};

// None, ..., bool, int, float, str or a heap object
using Value = std::variant<NoneType, EllipsisType, bool, int64_t, double, StrPtr, ObjRef>;

// Keyword arguments of a call, in the order they were passed
using KwArgs = std::vector<std::pair<std::string, Value>>;

enum class ObjectKind : uint8_t {
    LIST,
    TUPLE,
    DICT,
    SET,
    RANGE,
    ITERATOR,
    FUNCTION,
    BUILTIN_FUNCTION,
    BOUND_METHOD,
    EXCEPTION_CLASS,
    EXCEPTION,
    DICT_VIEW,
    SCOPE,
};

class Object {
    friend class Heap;
    friend class ObjRef;

    size_t refcount_ = 0;
    Heap* heap_ = nullptr;
    Object* prev_ = nullptr;
    Object* next_ = nullptr;
    size_t charged_bytes_ = 0;

public:
    const ObjectKind kind;

    explicit Object(ObjectKind kind) noexcept : kind{kind} {}

    Object(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(const Object&) = delete;
    Object& operator=(Object&&) = delete;

    virtual ~Object() = default;

    [[nodiscard]] Heap& heap() const noexcept { return *heap_; }

    // Moves out every object reference held, leaving the object empty
    virtual void clear_refs(std::vector<ObjRef>& out) noexcept = 0;
};

// Returns the object of type T held by @p val or nullptr
template <class T>
T* as(const Value& val) noexcept {
    const auto* ref = std::get_if<ObjRef>(&val);
    if (ref and (*ref)->kind == T::KIND) {
        return static_cast<T*>(ref->get());
    }
    return nullptr;
}

void move_refs(Value& val, std::vector<ObjRef>& out) noexcept;
void move_refs(std::vector<Value>& values, std::vector<ObjRef>& out) noexcept;

// Insertion ordered hash table, storage of dict and set
class OrderedTable {
public:
    struct Entry {
        Value key;
        Value value; // None for sets
        size_t hash;
    };

private:
    std::vector<std::optional<Entry>> entries_;
    std::unordered_multimap<size_t, size_t> index_; // hash => position in entries_
    size_t size_ = 0;

    void compact();

public:
    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // Slots, erased entries are nullopt
    [[nodiscard]] const std::vector<std::optional<Entry>>& slots() const noexcept {
        return entries_;
    }

    // Throws TypeError if @p key is unhashable
    [[nodiscard]] std::optional<size_t> find(const Value& key) const;

    [[nodiscard]] Value* find_value(const Value& key);

    // Returns false if the key was already present (then its value is replaced)
    bool insert(Value key, Value value);

    bool erase(const Value& key);

    void erase_at(size_t pos);

    void clear() noexcept;

    [[nodiscard]] size_t memory_usage() const noexcept;

    void clear_refs(std::vector<ObjRef>& out) noexcept;
};

struct ListObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::LIST;

    std::vector<Value> items;

    ListObject() noexcept : Object{KIND} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { move_refs(items, out); }
};

struct TupleObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::TUPLE;

    std::vector<Value> items;

    TupleObject() noexcept : Object{KIND} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { move_refs(items, out); }
};

struct DictObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::DICT;

    OrderedTable table;

    DictObject() noexcept : Object{KIND} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { table.clear_refs(out); }
};

struct SetObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::SET;

    OrderedTable table;

    SetObject() noexcept : Object{KIND} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { table.clear_refs(out); }
};

struct RangeObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::RANGE;

    int64_t start;
    int64_t stop;
    int64_t step;

    RangeObject(int64_t start, int64_t stop, int64_t step) noexcept
    : Object{KIND}
    , start{start}
    , stop{stop}
    , step{step} {}

    [[nodiscard]] int64_t length() const noexcept;

    [[nodiscard]] int64_t at(int64_t idx) const noexcept { return start + idx * step; }

    void clear_refs(std::vector<ObjRef>& /*out*/) noexcept override {}
};

struct IteratorObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::ITERATOR;

    enum class Source : uint8_t {
        SEQUENCE, // list or tuple
        GENERATOR, // values precomputed into a tuple
        STRING,
        RANGE,
        TABLE_KEYS,
        TABLE_VALUES,
        TABLE_ITEMS,
        ENUMERATE,
        ZIP,
        MAP,
        FILTER,
    };

    Source source;
    ObjRef target; // the iterated object
    StrPtr str; // for STRING
    std::vector<ObjRef> inner; // iterators of ENUMERATE, ZIP, MAP and FILTER
    Value func; // for MAP and FILTER
    size_t pos = 0; // in bytes for STRING
    int64_t counter = 0; // for ENUMERATE
    size_t expected_size = 0; // dicts and sets must not change size while iterated
    bool exhausted = false;

    explicit IteratorObject(Source source) noexcept : Object{KIND}, source{source} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override {
        if (target) {
            out.emplace_back(std::move(target));
        }
        for (auto& it : inner) {
            out.emplace_back(std::move(it));
        }
        inner.clear();
        move_refs(func, out);
    }
};

struct FunctionObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::FUNCTION;

    std::string name; // "<lambda>" for lambdas
    const Arguments* args = nullptr;
    const Body* body = nullptr; // null for lambdas
    const Expr* lambda_body = nullptr; // null for def functions
    const ScopeInfo* scope_info = nullptr;
    std::vector<Value> defaults; // of the last positional parameters
    std::vector<std::optional<Value>> kw_defaults; // parallel to args->kwonlyargs
    ObjRef closure; // enclosing function's scope, null at module level

    FunctionObject() noexcept : Object{KIND} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override {
        move_refs(defaults, out);
        for (auto& val : kw_defaults) {
            if (val) {
                move_refs(*val, out);
            }
        }
        if (closure) {
            out.emplace_back(std::move(closure));
        }
    }
};

enum class Builtin : uint8_t {
    STR,
    INT,
    FLOAT,
    BOOL,
    LIST,
    DICT,
    TUPLE,
    SET,
    LEN,
    RANGE,
    ENUMERATE,
    ZIP,
    MAP,
    FILTER,
    SORTED,
    SUM,
    MIN,
    MAX,
    ABS,
    ROUND,
    PRINT,
};

struct BuiltinFunctionObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::BUILTIN_FUNCTION;

    Builtin builtin;
    std::string_view name;

    BuiltinFunctionObject(Builtin builtin, std::string_view name) noexcept
    : Object{KIND}
    , builtin{builtin}
    , name{name} {}

    void clear_refs(std::vector<ObjRef>& /*out*/) noexcept override {}
};

// Method of a built-in type bound to its receiver, e.g. `"abc".upper`
struct BoundMethodObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::BOUND_METHOD;

    Value self;
    std::string_view name;

    BoundMethodObject(Value self, std::string_view name) noexcept
    : Object{KIND}
    , self{std::move(self)}
    , name{name} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { move_refs(self, out); }
};

enum class ExceptionKind : uint8_t;

struct ExceptionClassObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::EXCEPTION_CLASS;

    ExceptionKind exception_kind;

    explicit ExceptionClassObject(ExceptionKind exception_kind) noexcept
    : Object{KIND}
    , exception_kind{exception_kind} {}

    void clear_refs(std::vector<ObjRef>& /*out*/) noexcept override {}
};

struct ExceptionObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::EXCEPTION;

    ExceptionKind exception_kind;
    std::vector<Value> args;

    explicit ExceptionObject(ExceptionKind exception_kind) noexcept
    : Object{KIND}
    , exception_kind{exception_kind} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override { move_refs(args, out); }
};

// dict.keys(), dict.values() or dict.items()
struct DictViewObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::DICT_VIEW;

    enum class View : uint8_t {
        KEYS,
        VALUES,
        ITEMS,
    };

    ObjRef dict;
    View view;

    DictViewObject(ObjRef dict, View view) noexcept
    : Object{KIND}
    , dict{std::move(dict)}
    , view{view} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override {
        out.emplace_back(std::move(dict));
    }
};

// Variables of a module or of a single function call
struct ScopeObject final : Object {
    static constexpr ObjectKind KIND = ObjectKind::SCOPE;

    const ScopeInfo* info;
    std::unordered_map<std::string, Value> vars;
    ObjRef parent; // enclosing function's scope, null for the module and its functions

    ScopeObject(const ScopeInfo* info, ObjRef parent) noexcept
    : Object{KIND}
    , info{info}
    , parent{std::move(parent)} {}

    void clear_refs(std::vector<ObjRef>& out) noexcept override {
        for (auto& [name, val] : vars) {
            move_refs(val, out);
        }
        vars.clear();
        if (parent) {
            out.emplace_back(std::move(parent));
        }
    }
};

} // namespace chk::lang
