#include "metainfo.hpp"

#include <cctype> // isdigit
#include <vector>

namespace seedwise {

std::string metainfo_error_category::message(int env) const
{
    switch(static_cast<metainfo_errc>(env))
    {
    case metainfo_errc::invalid_bencoding: return "Invalid bencoded metainfo";
    case metainfo_errc::missing_info: return "No 'info' map in metainfo";
    case metainfo_errc::missing_name: return "No 'name' in metainfo info map";
    case metainfo_errc::invalid_file_entry: return "Invalid file entry in metainfo";
    default: return "Unknown";
    }
}

std::error_condition
metainfo_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<metainfo_errc>(ev))
    {
    case metainfo_errc::invalid_bencoding:
        return std::errc::illegal_byte_sequence;
    default:
        return std::error_condition(ev, *this);
    }
}

const metainfo_error_category& metainfo_category()
{
    static metainfo_error_category instance;
    return instance;
}

std::error_code make_error_code(metainfo_errc e)
{
    return std::error_code(static_cast<int>(e), metainfo_category());
}

std::error_condition make_error_condition(metainfo_errc e)
{
    return std::error_condition(static_cast<int>(e), metainfo_category());
}

namespace {

/**
 * A decoded bencode element. Metainfo files are small, so unlike a general purpose
 * decoder this simply builds a tree.
 */
struct belement
{
    enum class btype { number, string, list, map } type = btype::string;

    int64_t number = 0;
    std::string string;
    // Both lists and map values.
    std::vector<belement> elements;
    // Map keys, parallel to elements.
    std::vector<std::string> keys;

    const belement* find(const std::string& key, const btype t) const
    {
        if(type != btype::map) { return nullptr; }
        for(auto i = 0; i < int(keys.size()); ++i)
        {
            if(keys[i] == key) { return elements[i].type == t ? &elements[i] : nullptr; }
        }
        return nullptr;
    }
};

class bdecoder
{
    // Nesting deeper than this is not a torrent file, and unbounded recursion on
    // crafted input would exhaust the stack.
    static constexpr int max_depth = 64;

    const std::string& encoded_;

    // The index of the current character in encoded_.
    int pos_ = 0;

public:

    explicit bdecoder(const std::string& s) : encoded_(s) {}

    belement decode(error_code& error)
    {
        error.clear();
        belement e = decode_dispatch(0, error);
        // trailing garbage is rejected as well
        if(!error && pos_ != int(encoded_.length()))
        {
            error = make_error_code(metainfo_errc::invalid_bencoding);
        }
        return e;
    }

private:

    bool at_end() const noexcept { return pos_ >= int(encoded_.length()); }

    void fail(error_code& error)
    {
        error = make_error_code(metainfo_errc::invalid_bencoding);
    }

    belement decode_dispatch(const int depth, error_code& error)
    {
        if(at_end() || depth > max_depth)
        {
            fail(error);
            return {};
        }
        const char c = encoded_[pos_];
        if(c == 'i') { return decode_bnumber(error); }
        else if(c == 'l') { return decode_blist(depth, error); }
        else if(c == 'd') { return decode_bmap(depth, error); }
        else if(std::isdigit(static_cast<unsigned char>(c))) { return decode_bstring(error); }
        fail(error);
        return {};
    }

    belement decode_bnumber(error_code& error)
    {
        belement e;
        e.type = belement::btype::number;
        // skip 'i'
        ++pos_;
        bool is_negative = false;
        if(!at_end() && encoded_[pos_] == '-')
        {
            is_negative = true;
            ++pos_;
        }
        const int start = pos_;
        while(!at_end() && std::isdigit(static_cast<unsigned char>(encoded_[pos_])))
        {
            e.number = e.number * 10 + (encoded_[pos_] - '0');
            ++pos_;
        }
        const int num_digits = pos_ - start;
        // no digits, leading zeros, "-0" or an overlong number
        if(num_digits == 0 || num_digits > 18
           || (encoded_[start] == '0' && (num_digits > 1 || is_negative)))
        {
            fail(error);
            return {};
        }
        // the first character after the digits in a number must be the 'e' end token
        if(at_end() || encoded_[pos_] != 'e')
        {
            fail(error);
            return {};
        }
        ++pos_;
        if(is_negative) { e.number = -e.number; }
        return e;
    }

    belement decode_bstring(error_code& error)
    {
        belement e;
        e.type = belement::btype::string;
        e.string = decode_raw_string(error);
        return e;
    }

    std::string decode_raw_string(error_code& error)
    {
        const int start = pos_;
        int64_t length = 0;
        while(!at_end() && std::isdigit(static_cast<unsigned char>(encoded_[pos_])))
        {
            length = length * 10 + (encoded_[pos_] - '0');
            ++pos_;
            if(length > int64_t(encoded_.length())) { break; }
        }
        // the first character after the digits in a string must be a colon
        if(pos_ == start || at_end() || encoded_[pos_] != ':'
           || (encoded_[start] == '0' && pos_ - start > 1))
        {
            fail(error);
            return {};
        }
        ++pos_;
        if(length > int64_t(encoded_.length()) - pos_)
        {
            fail(error);
            return {};
        }
        std::string s = encoded_.substr(pos_, length);
        pos_ += length;
        return s;
    }

    belement decode_blist(const int depth, error_code& error)
    {
        belement e;
        e.type = belement::btype::list;
        // go to first element in list
        ++pos_;
        while(!at_end() && encoded_[pos_] != 'e')
        {
            e.elements.emplace_back(decode_dispatch(depth + 1, error));
            if(error) { return {}; }
        }
        if(at_end())
        {
            fail(error);
            return {};
        }
        // go past the 'e' end token to the next element
        ++pos_;
        return e;
    }

    belement decode_bmap(const int depth, error_code& error)
    {
        belement e;
        e.type = belement::btype::map;
        ++pos_;
        while(!at_end() && encoded_[pos_] != 'e')
        {
            // keys must be strings
            if(!std::isdigit(static_cast<unsigned char>(encoded_[pos_])))
            {
                fail(error);
                return {};
            }
            e.keys.emplace_back(decode_raw_string(error));
            if(error) { return {}; }
            e.elements.emplace_back(decode_dispatch(depth + 1, error));
            if(error) { return {}; }
        }
        if(at_end())
        {
            fail(error);
            return {};
        }
        ++pos_;
        return e;
    }
};

/** Joins the path elements of a file entry with '/', or returns an empty string. */
std::string join_path(const belement& path_list)
{
    std::string path;
    for(const auto& element : path_list.elements)
    {
        if(element.type != belement::btype::string || element.string.empty())
        {
            return {};
        }
        if(!path.empty()) { path += '/'; }
        path += element.string;
    }
    return path;
}

} // namespace

file_manifest decode_manifest(const std::string& encoded, error_code& error)
{
    using btype = belement::btype;

    bdecoder decoder(encoded);
    const belement root = decoder.decode(error);
    if(error) { return {}; }
    if(root.type != btype::map)
    {
        error = make_error_code(metainfo_errc::invalid_bencoding);
        return {};
    }

    const belement* info = root.find("info", btype::map);
    if(info == nullptr)
    {
        error = make_error_code(metainfo_errc::missing_info);
        return {};
    }

    const belement* name = info->find("name", btype::string);
    if(name == nullptr || name->string.empty())
    {
        error = make_error_code(metainfo_errc::missing_name);
        return {};
    }

    file_manifest manifest;
    // if torrent is multi-file, there is a 'files' list in info map, otherwise info
    // map has a single 'length' parameter
    const belement* files = info->find("files", btype::list);
    if(files != nullptr)
    {
        for(const auto& file : files->elements)
        {
            const belement* length = file.find("length", btype::number);
            const belement* path = file.find("path", btype::list);
            if(length == nullptr || length->number < 0 || path == nullptr)
            {
                error = make_error_code(metainfo_errc::invalid_file_entry);
                return {};
            }
            std::string file_path = join_path(*path);
            if(file_path.empty())
            {
                error = make_error_code(metainfo_errc::invalid_file_entry);
                return {};
            }
            manifest.add_file(name->string + '/' + file_path, length->number);
        }
        if(!manifest.is_known())
        {
            error = make_error_code(metainfo_errc::invalid_file_entry);
            return {};
        }
    }
    else
    {
        const belement* length = info->find("length", btype::number);
        if(length == nullptr || length->number < 0)
        {
            error = make_error_code(metainfo_errc::invalid_file_entry);
            return {};
        }
        manifest.add_file(name->string, length->number);
    }
    return manifest;
}

} // namespace seedwise
