/**
 * @file table.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <typeinfo>
#include <ll/nt/table.hpp>
#include <ll/time.hpp>
#include <ll/codec/arrays.hpp>

#include <loguru.hpp>

using ll::nt::Table;
using ll::nt::EntryType;
using ll::nt::Value;
using ll::nt::DoubleArraySubscriber;
using ll::nt::TimestampedDoubleArray;
using std::string;
using std::vector;

namespace {

// Convert convenience types to the canonical entry types.
std::any normalise(const std::any &v) {
    const auto &t = v.type();
    if (t == typeid(int)) return static_cast<int64_t>(std::any_cast<int>(v));
    if (t == typeid(unsigned int)) return static_cast<int64_t>(std::any_cast<unsigned int>(v));
    if (t == typeid(long long)) return static_cast<int64_t>(std::any_cast<long long>(v));
    if (t == typeid(float)) return static_cast<double>(std::any_cast<float>(v));
    if (t == typeid(const char*)) return string(std::any_cast<const char*>(v));
    return v;
}

bool asDouble(const std::any &v, double &out) {
    const auto &t = v.type();
    if (t == typeid(double)) {
        out = std::any_cast<double>(v);
    } else if (t == typeid(int64_t)) {
        out = static_cast<double>(std::any_cast<int64_t>(v));
    } else if (t == typeid(bool)) {
        out = std::any_cast<bool>(v) ? 1.0 : 0.0;
    } else if (t == typeid(int)) {
        out = static_cast<double>(std::any_cast<int>(v));
    } else if (t == typeid(float)) {
        out = static_cast<double>(std::any_cast<float>(v));
    } else {
        return false;
    }
    return true;
}

}  // namespace

EntryType Table::typeOf(const std::any &value) {
    if (!value.has_value()) return EntryType::kUnassigned;
    const auto &t = value.type();
    if (t == typeid(bool)) return EntryType::kBoolean;
    if (t == typeid(double)) return EntryType::kDouble;
    if (t == typeid(int64_t)) return EntryType::kInteger;
    if (t == typeid(string)) return EntryType::kString;
    if (t == typeid(vector<double>)) return EntryType::kDoubleArray;
    if (t == typeid(vector<string>)) return EntryType::kStringArray;
    return EntryType::kUnassigned;
}

bool Table::set(const string &key, const std::any &value, int64_t time) {
    Value v;
    v.data = normalise(value);
    v.time = time;

    if (typeOf(v.data) == EntryType::kUnassigned) {
        LOG(WARNING) << "Unsupported value type for '" << key << "': " << value.type().name();
        return false;
    }

    if (!put(key, v)) return false;
    change_cb_.trigger(key, v);
    return true;
}

bool Table::set(const string &key, const std::any &value) {
    return set(key, value, ll::time::get_time_micro());
}

EntryType Table::type(const string &key) const {
    return typeOf(get(key).data);
}

bool Table::getBoolean(const string &key, bool def) const {
    auto v = get(key);
    double d;
    if (!asDouble(v.data, d)) return def;
    return d != 0.0;
}

double Table::getDouble(const string &key, double def) const {
    auto v = get(key);
    double d;
    return (asDouble(v.data, d)) ? d : def;
}

int64_t Table::getInteger(const string &key, int64_t def) const {
    auto v = get(key);
    if (v.data.type() == typeid(int64_t)) return std::any_cast<int64_t>(v.data);
    double d;
    return (asDouble(v.data, d)) ? ll::codec::toIntSaturating<int64_t>(d) : def;
}

string Table::getString(const string &key, const string &def) const {
    auto v = get(key);
    if (v.data.type() != typeid(string)) return def;
    return std::any_cast<string>(v.data);
}

vector<double> Table::getDoubleArray(const string &key, const vector<double> &def) const {
    auto v = get(key);
    if (v.data.type() != typeid(vector<double>)) return def;
    return std::any_cast<vector<double>>(v.data);
}

vector<string> Table::getStringArray(const string &key, const vector<string> &def) const {
    auto v = get(key);
    if (v.data.type() != typeid(vector<string>)) return def;
    return std::any_cast<vector<string>>(v.data);
}

ll::Handle Table::onChange(const string &key, const ll::nt::ChangeCallback &cb) {
    return change_cb_.on([key, cb](const string &k, const Value &v) {
        if (k != key) return true;
        return cb(k, v);
    });
}

// ==== Subscriber =============================================================

DoubleArraySubscriber::DoubleArraySubscriber(const ll::nt::TablePtr &table, const string &key, size_t capacity)
        : table_(table), key_(key), capacity_((capacity > 0) ? capacity : 1) {
    handle_ = table_->onChange(key_, [this](const string &k, const Value &v) {
        if (v.data.type() != typeid(vector<double>)) return true;

        UNIQUE_LOCK(mtx_, lk);
        while (queue_.size() >= capacity_) queue_.pop_front();
        queue_.push_back({v.time, std::any_cast<vector<double>>(v.data)});
        return true;
    });
}

vector<TimestampedDoubleArray> DoubleArraySubscriber::readQueue() {
    UNIQUE_LOCK(mtx_, lk);
    vector<TimestampedDoubleArray> result(queue_.begin(), queue_.end());
    queue_.clear();
    return result;
}

vector<double> DoubleArraySubscriber::get() const {
    return table_->getDoubleArray(key_);
}
