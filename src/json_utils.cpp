// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <rapidjson/allocators.h>
#include <rapidjson/encodings.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/reader.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "json_utils.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"
#include "object_view.hpp"

namespace authflow {

namespace {

struct string_view_stream {
    using Ch = std::string_view::value_type;

    explicit string_view_stream(std::string_view str) : src(str) {}

    [[nodiscard]] char Peek() const
    {
        if (idx < src.size()) [[likely]] {
            return src[idx];
        }
        return '\0';
    }
    char Take()
    {
        if (idx < src.size()) [[likely]] {
            return src[idx++];
        }
        return '\0';
    }
    [[nodiscard]] size_t Tell() const { return idx; }

    static char *PutBegin()
    {
        assert(false);
        return nullptr;
    }
    static void Put(Ch /*unused*/) { assert(false); }
    static void Flush() { assert(false); }
    static size_t PutEnd(Ch * /*unused*/)
    {
        assert(false);
        return 0;
    }

    std::string_view src;
    std::size_t idx{0};
};

class object_reader_handler
    : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, object_reader_handler> {
public:
    object_reader_handler() { stack_.reserve(max_json_depth + 1); }
    ~object_reader_handler() = default;
    object_reader_handler(object_reader_handler &&) = delete;
    object_reader_handler(const object_reader_handler &) = delete;
    object_reader_handler &operator=(object_reader_handler &&) = delete;
    object_reader_handler &operator=(const object_reader_handler &) = delete;

    bool Null() { return skipping() || emplace(owned_object::make_null()); }
    bool Bool(bool b) { return skipping() || emplace(owned_object::make_boolean(b)); }
    bool Int(int i) { return skipping() || emplace(owned_object::make_signed(i)); }
    bool Uint(unsigned u) { return skipping() || emplace(owned_object::make_unsigned(u)); }
    bool Int64(int64_t i) { return skipping() || emplace(owned_object::make_signed(i)); }
    bool Uint64(uint64_t u) { return skipping() || emplace(owned_object::make_unsigned(u)); }
    bool Double(double d) { return skipping() || emplace(owned_object::make_float(d)); }

    bool String(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        return skipping() || emplace(owned_object::make_string(str, length));
    }

    bool Key(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        if (!skipping()) {
            key_.assign(str, length);
        }
        return true;
    }

    bool StartObject()
    {
        if (skipping()) {
            ++depth_skip_count_;
            return true;
        }

        return emplace(owned_object::make_map());
    }

    bool EndObject(rapidjson::SizeType /*memberCount*/) { return end_container(); }

    bool StartArray()
    {
        if (skipping()) {
            ++depth_skip_count_;
            return true;
        }

        return emplace(owned_object::make_array());
    }

    bool EndArray(rapidjson::SizeType /*elementCount*/) { return end_container(); }

    owned_object finalize()
    {
        stack_.clear();
        return std::move(root_);
    }

private:
    [[nodiscard]] bool skipping() const { return stack_.size() > max_json_depth; }

    bool end_container()
    {
        assert(!stack_.empty());
        depth_skip_count_ -= static_cast<std::size_t>(depth_skip_count_ > 0);
        if (depth_skip_count_ == 0) {
            stack_.pop_back();
        }
        return true;
    }

    bool emplace(owned_object &&object)
    {
        try {
            if (stack_.empty()) {
                assert(root_.is_invalid());

                root_ = std::move(object);
                if (root_.is_container()) {
                    stack_.emplace_back(&root_);
                }
            } else {
                auto *container = stack_.back();
                auto &child = container->is_map()
                                  ? container->emplace(key_, std::move(object))
                                  : container->emplace_back(std::move(object));
                if (child.is_container()) {
                    stack_.push_back(&child);
                    if (stack_.size() > max_json_depth) {
                        depth_skip_count_ = 1;
                    }
                }
            }
        } catch (const std::exception &e) {
            AUTHFLOW_DEBUG("Failed to insert JSON value: {}", e.what());
            return false;
        }

        return true;
    }

    owned_object root_;
    // Each pointer refers to the innermost container of its predecessor,
    // only the top of the stack is ever modified.
    std::vector<owned_object *> stack_;
    std::string key_;
    std::size_t depth_skip_count_{0};
};

class string_buffer {
public:
    using Ch = char;

protected:
    static constexpr std::size_t default_capacity = 1024;

public:
    string_buffer() { buffer_.reserve(default_capacity); }

    void Put(Ch c) { buffer_.push_back(c); }
    void PutUnsafe(Ch c) { Put(c); }
    void Flush() {}
    void Clear() { buffer_.clear(); }
    void ShrinkToFit() { buffer_.shrink_to_fit(); }
    void Reserve(size_t count) { buffer_.reserve(count); }

    [[nodiscard]] const Ch *GetString() const { return buffer_.c_str(); }
    [[nodiscard]] size_t GetSize() const { return buffer_.size(); }

    [[nodiscard]] size_t GetLength() const { return GetSize(); }

    std::string &get_string_ref() { return buffer_; }

protected:
    std::string buffer_;
};

template <typename Writer>
// NOLINTNEXTLINE(misc-no-recursion, google-runtime-references)
void object_to_json_helper(object_view obj, Writer &writer)
{
    switch (obj.type()) {
    case object_type::boolean:
        writer.Bool(obj.as<bool>());
        break;
    case object_type::int64:
        writer.Int64(obj.as<int64_t>());
        break;
    case object_type::uint64:
        writer.Uint64(obj.as<uint64_t>());
        break;
    case object_type::float64:
        writer.Double(obj.as<double>());
        break;
    case object_type::string: {
        auto str = obj.as<std::string_view>();
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    } break;
    case object_type::map:
        writer.StartObject();
        for (std::size_t i = 0; i < obj.size(); ++i) {
            auto key = obj.key_at(i);
            writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
            object_to_json_helper(obj.at(i), writer);
        }
        writer.EndObject();
        break;
    case object_type::array:
        writer.StartArray();
        for (std::size_t i = 0; i < obj.size(); ++i) { object_to_json_helper(obj.at(i), writer); }
        writer.EndArray();
        break;
    case object_type::null:
    case object_type::invalid:
    default:
        writer.Null();
        break;
    }
}

} // namespace

std::string object_to_json(object_view object)
{
    string_buffer buffer;
    // Non-finite numbers are rendered as NaN/Infinity rather than failing
    rapidjson::Writer<decltype(buffer), rapidjson::UTF8<>, rapidjson::UTF8<>,
        rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>
        writer(buffer);

    object_to_json_helper(object, writer);

    return std::move(buffer.get_string_ref());
}

owned_object json_to_object(std::string_view json)
{
    object_reader_handler handler;
    string_view_stream ss(json);

    rapidjson::Reader reader;
    const rapidjson::ParseResult res = reader.Parse(ss, handler);
    if (res.IsError()) {
        AUTHFLOW_DEBUG("Failed to parse JSON at offset {}: {}", res.Offset(),
            rapidjson::GetParseError_En(res.Code()));
        return {};
    }

    return handler.finalize();
}

} // namespace authflow
