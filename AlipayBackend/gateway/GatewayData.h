#pragma once

#include "StringCase.h"
#include <json/json.h>
#include <string>
#include <utility>
#include <vector>

namespace alipay
{
using FieldList = std::vector<std::pair<std::string, std::string>>;

class GatewayData
{
  public:
    using Entry = std::pair<std::string, std::string>;

    GatewayData() = default;

    template <typename T>
    void add(const T &object, StringCase stringCase)
    {
        for (const auto &field : object.fields())
        {
            if (field.second.empty())
            {
                continue;
            }
            add(toCase(field.first, stringCase), field.second);
        }
    }

    // Overwrites in place when the key exists, appends otherwise.
    void add(const std::string &key, const std::string &value);

    bool remove(const std::string &key);
    bool exists(const std::string &key) const;
    std::string getStringValue(const std::string &key) const;

    size_t size() const
    {
        return entries_.size();
    }
    bool empty() const
    {
        return entries_.empty();
    }
    void clear()
    {
        entries_.clear();
    }
    const Entry &operator[](size_t index) const
    {
        return entries_.at(index);
    }
    const std::vector<Entry> &entries() const
    {
        return entries_;
    }

    // Exact input of signing and verification.
    std::string toCanonicalString(bool includeSignatureFields) const;
    std::string toUrlEncodedBody() const;

    std::string toForm(const std::string &url) const;

    Json::Value toJson() const;

    void fromJson(const std::string &text);
    void fromJson(const Json::Value &object);

    void fromUrl(const std::string &query);

    template <typename T>
    T toObject(StringCase stringCase) const
    {
        T object;
        for (const auto &entry : entries_)
        {
            object.setField(fromCase(entry.first, stringCase), entry.second);
        }
        return object;
    }

  private:
    std::vector<Entry>::iterator find(const std::string &key);
    std::vector<Entry>::const_iterator find(const std::string &key) const;

    std::vector<Entry> entries_;
};
}  // namespace alipay
