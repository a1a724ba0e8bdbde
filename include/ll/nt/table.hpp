/**
 * @file table.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <any>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <ll/handle.hpp>
#include <ll/threads.hpp>

namespace ll {
namespace nt {

/**
 * @brief Value types that a table entry can hold.
 *
 */
enum struct EntryType {
    kUnassigned = 0,
    kBoolean,
    kDouble,
    kInteger,
    kString,
    kDoubleArray,
    kStringArray
};

/**
 * @brief An entry value with the server time at which it was published.
 * An empty `data` means the entry does not exist.
 *
 */
struct Value {
    std::any data;
    int64_t time = 0;  // Server time in microseconds
};

/**
 * @brief A double array sample as queued by a subscriber.
 *
 */
struct TimestampedDoubleArray {
    int64_t timestamp = 0;  // Server time in microseconds
    std::vector<double> value;
};

using ChangeCallback = std::function<bool(const std::string &, const Value &)>;

/**
 * A named set of key/value entries shared with the camera. Implementations
 * bind this to a real-time publish/subscribe bus; MemoryTable keeps the
 * entries in process.
 *
 * Entry values are held in `std::any` and must be one of `bool`, `double`,
 * `int64_t`, `std::string`, `std::vector<double>` or
 * `std::vector<std::string>`. Other integer, float and C string values are
 * converted on write. Typed getters never throw: a missing entry or a value
 * of the wrong type gives the default.
 */
class Table {
 public:
    virtual ~Table() {}

    /**
     * @brief Name of the table, usually the camera hostname.
     *
     * @return std::string
     */
    virtual std::string name() const = 0;

    /**
     * @brief Publish a new value for a key and notify change callbacks.
     *
     * @param key
     * @param value
     * @param time Server time in microseconds
     * @return true if written
     * @return false if the value type is not supported
     */
    bool set(const std::string &key, const std::any &value, int64_t time);

    /**
     * @brief Publish a new value stamped with the current time.
     *
     */
    bool set(const std::string &key, const std::any &value);

    /**
     * @brief Get the current value of an entry. The value is empty if the
     * entry does not exist.
     *
     * @param key
     * @return Value
     */
    virtual Value get(const std::string &key) const = 0;

    virtual bool exists(const std::string &key) const = 0;

    /**
     * @brief All keys that currently hold a value.
     *
     * @return std::vector<std::string>
     */
    virtual std::vector<std::string> keys() const = 0;

    /**
     * @brief Send pending writes immediately rather than at the next periodic
     * update. Writes are visible without a flush, this only reduces latency.
     *
     */
    virtual void flush() = 0;

    EntryType type(const std::string &key) const;

    bool getBoolean(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    int64_t getInteger(const std::string &key, int64_t def = 0) const;
    std::string getString(const std::string &key, const std::string &def = "") const;
    std::vector<double> getDoubleArray(const std::string &key, const std::vector<double> &def = {}) const;
    std::vector<std::string> getStringArray(const std::string &key, const std::vector<std::string> &def = {}) const;

    /**
     * @brief Register a callback for writes to one key. Callbacks run in the
     * writing thread. Return false from the callback to unregister it.
     *
     * @param key
     * @param cb
     * @return ll::Handle
     */
    ll::Handle onChange(const std::string &key, const ChangeCallback &cb);

    /**
     * @brief Get the entry type of a value.
     *
     * @param value
     * @return EntryType, kUnassigned if empty or not supported.
     */
    static EntryType typeOf(const std::any &value);

 protected:
    /** Store an already validated value. */
    virtual bool put(const std::string &key, const Value &value) = 0;

 private:
    ll::Handler<const std::string &, const Value &> change_cb_;
};

using TablePtr = std::shared_ptr<Table>;

/**
 * @brief Queue of every double array written to one key since the previous
 * read. If more than `capacity` samples arrive between reads the oldest are
 * dropped. Not copyable, keep in a smart pointer.
 *
 */
class DoubleArraySubscriber {
 public:
    static constexpr size_t kDefaultCapacity = 20;

    DoubleArraySubscriber(const TablePtr &table, const std::string &key, size_t capacity = kDefaultCapacity);
    DoubleArraySubscriber(const DoubleArraySubscriber &) = delete;
    DoubleArraySubscriber &operator=(const DoubleArraySubscriber &) = delete;

    /**
     * @brief Take all queued samples, oldest first.
     *
     * @return std::vector<TimestampedDoubleArray>
     */
    std::vector<TimestampedDoubleArray> readQueue();

    /** Current value of the entry, not affecting the queue. */
    std::vector<double> get() const;

    inline const std::string &key() const { return key_; }

 private:
    TablePtr table_;
    std::string key_;
    size_t capacity_;
    DECLARE_MUTEX(mtx_);
    std::deque<TimestampedDoubleArray> queue_;
    ll::Handle handle_;  // Last so it is released first
};

/**
 * @brief A connection to the publish/subscribe bus that provides tables by
 * name.
 *
 */
class Instance {
 public:
    virtual ~Instance() {}

    /**
     * @brief Get or create the table with the given name.
     *
     * @param name
     * @return TablePtr
     */
    virtual TablePtr getTable(const std::string &name) = 0;

    /** Flush all tables. */
    virtual void flush() = 0;
};

using InstancePtr = std::shared_ptr<Instance>;

/**
 * @brief Get the process wide instance. If none has been set then an in
 * process MemoryInstance is created on first use.
 *
 * @return InstancePtr
 */
InstancePtr getDefaultInstance();

/**
 * @brief Replace the process wide instance, for example with a binding to a
 * real bus. Existing cameras keep their tables.
 *
 * @param instance
 */
void setDefaultInstance(const InstancePtr &instance);

}  // namespace nt
}  // namespace ll
