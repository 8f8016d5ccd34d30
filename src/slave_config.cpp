// ============================================================================
//  File: src/slave_config.cpp — Document de configuration esclaves (JSON-lite)
// ============================================================================

#include "pxld/slave_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>

namespace pxld
{

namespace json_lite
{

static size_t skip_ws(const std::string& js, size_t p)
{
    while(p<js.size() && std::isspace((unsigned char)js[p])) ++p;
    return p;
}

// Position juste après la chaîne qui commence en `p` (js[p]=='"').
static size_t skip_string(const std::string& js, size_t p)
{
    ++p;
    while(p<js.size() && js[p]!='"')
    {
        if(js[p]=='\\') ++p;
        ++p;
    }
    return p<js.size()? p+1 : std::string::npos;
}

// Indice du délimiteur fermant correspondant à js[open] ('[' ou '{').
static size_t match_close(const std::string& js, size_t open)
{
    int depth=0;
    size_t p=open;
    while(p<js.size())
    {
        char c=js[p];
        if(c=='"')
        {
            p=skip_string(js,p);
            if(p==std::string::npos) return std::string::npos;
            continue;
        }
        if(c=='[' || c=='{') ++depth;
        else if(c==']' || c=='}')
        {
            if(--depth==0) return p;
        }
        ++p;
    }
    return std::string::npos;
}

bool find_key(const std::string& js, const std::string& key, size_t& value_pos)
{
    const std::string pat = "\""+key+"\"";
    size_t p = js.find(pat);
    while(p!=std::string::npos)
    {
        size_t q = skip_ws(js, p+pat.size());
        if(q<js.size() && js[q]==':')
        {
            value_pos = skip_ws(js, q+1);
            return value_pos<js.size();
        }
        p = js.find(pat, p+1);
    }
    return false;
}

bool find_str(const std::string& js, const std::string& key, std::string& out)
{
    size_t p;
    if(!find_key(js,key,p) || js[p]!='"') return false;
    size_t e = skip_string(js, p);
    if(e==std::string::npos) return false;
    out = js.substr(p+1, e-p-2);
    return true;
}

bool find_uint(const std::string& js, const std::string& key, uint64_t& out)
{
    size_t p;
    if(!find_key(js,key,p)) return false;
    uint64_t v=0;
    bool any=false;
    while(p<js.size() && std::isdigit((unsigned char)js[p]))
    {
        any=true;
        v=v*10+(uint64_t)(js[p]-'0');
        ++p;
    }
    if(!any) return false;
    out=v;
    return true;
}

bool find_array(const std::string& js, const std::string& key, std::string& body)
{
    size_t p;
    if(!find_key(js,key,p) || js[p]!='[') return false;
    size_t e = match_close(js, p);
    if(e==std::string::npos) return false;
    body = js.substr(p+1, e-p-1);
    return true;
}

std::vector<std::string> split_objects(const std::string& array_body)
{
    std::vector<std::string> out;
    size_t p=0;
    while(p<array_body.size())
    {
        if(array_body[p]=='{')
        {
            size_t e = match_close(array_body, p);
            if(e==std::string::npos) break;
            out.push_back(array_body.substr(p, e-p+1));
            p=e+1;
            continue;
        }
        if(array_body[p]=='"')
        {
            p=skip_string(array_body,p);
            if(p==std::string::npos) break;
            continue;
        }
        ++p;
    }
    return out;
}

std::string strip_array(const std::string& js, const std::string& key)
{
    size_t p;
    if(!find_key(js,key,p) || js[p]!='[') return js;
    size_t e = match_close(js, p);
    if(e==std::string::npos) return js;
    return js.substr(0,p+1) + js.substr(e);
}

} // namespace json_lite

// ============================== SlaveConfig =================================

uint32_t SlaveConfig::pixel_count() const
{
    uint32_t n=0;
    for(const OutputSpec& o : outputs) n += o.count;
    return n;
}

uint64_t SlaveConfig::raw_length() const
{
    uint64_t n=0;
    for(const OutputSpec& o : outputs) n = std::max(n, o.raw_end());
    return n;
}

bool SlaveConfig::led_type_at(uint32_t led_index, LedType& out) const
{
    for(const OutputSpec& o : outputs)
    {
        if(led_index < o.count)
        {
            out = o.type;
            return true;
        }
        led_index -= o.count;
    }
    return false;
}

bool SlaveConfig::is_monochrome() const
{
    if(outputs.empty()) return false;
    return std::all_of(outputs.begin(), outputs.end(), [](const OutputSpec& o)
    {
        return o.type==LedType::STANDARD_LED;
    });
}

const SlaveConfig* SlaveConfigSet::find(uint8_t slave_id) const
{
    for(const SlaveConfig& s : slaves)
    {
        if(s.slave_id==slave_id) return &s;
    }
    return nullptr;
}

// ================================ Parsing ===================================

static bool parse_output(const std::string& js, uint8_t slave_id, OutputSpec& o, PxldError* err)
{
    const std::string where = "slave " + std::to_string(slave_id) + " output";
    std::string s;
    uint64_t v=0;
    if(!json_lite::find_str(js,"type",s))
        return fail(err, FormatError::ConfigInvalid, where + " has no \"type\"");
    if(!parse_led_type(s, o.type))
        return fail(err, FormatError::ConfigInvalid, where + " has unknown LED type \"" + s + "\"");
    json_lite::find_str(js,"label",o.label);
    json_lite::find_str(js,"description",o.description);
    if(json_lite::find_uint(js,"count",v))       o.count = (uint32_t)v;
    if(json_lite::find_uint(js,"data_offset",v)) o.data_offset = (uint32_t)v;
    o.bytes_per_pixel = 3;  // pas de capture par défaut, quel que soit le type
    if(json_lite::find_uint(js,"bytes_per_pixel",v)) o.bytes_per_pixel = (uint32_t)v;
    if(o.bytes_per_pixel < raw_bytes_per_led(o.type))
        return fail(err, FormatError::ConfigInvalid,
                    where + " '" + o.label + "': bytes_per_pixel " + std::to_string(o.bytes_per_pixel) +
                    " too small for " + led_type_name(o.type));
    return true;
}

static bool parse_slave(const std::string& js, SlaveConfig& sc, PxldError* err)
{
    const std::string own = json_lite::strip_array(js, "outputs");
    uint64_t id=0;
    if(!json_lite::find_uint(own,"slave_id",id) || id>255)
        return fail(err, FormatError::ConfigInvalid, "slave without a valid \"slave_id\" (0..255)");
    sc.slave_id = (uint8_t)id;
    json_lite::find_str(own,"name",sc.name);
    json_lite::find_str(own,"description",sc.description);

    std::string body;
    if(json_lite::find_array(js,"outputs",body))
    {
        for(const std::string& oj : json_lite::split_objects(body))
        {
            OutputSpec o;
            if(!parse_output(oj, sc.slave_id, o, err)) return false;
            sc.outputs.push_back(o);
        }
    }
    return true;
}

bool parse_slave_config(const std::string& json, SlaveConfigSet& out, PxldError* err)
{
    size_t first = json_lite::skip_ws(json, 0);
    if(first>=json.size()) return fail(err, FormatError::ConfigInvalid, "empty configuration");

    std::string body;
    if(json[first]=='[')
    {
        size_t e = json_lite::match_close(json, first);
        if(e==std::string::npos) return fail(err, FormatError::ConfigInvalid, "unterminated top-level array");
        body = json.substr(first+1, e-first-1);
    }
    else if(!json_lite::find_array(json,"slaves",body))
    {
        return fail(err, FormatError::ConfigInvalid, "no \"slaves\" array");
    }

    SlaveConfigSet set;
    std::set<uint8_t> ids;
    for(const std::string& sj : json_lite::split_objects(body))
    {
        SlaveConfig sc;
        if(!parse_slave(sj, sc, err)) return false;
        if(!ids.insert(sc.slave_id).second)
            return fail(err, FormatError::ConfigInvalid, "duplicate slave_id " + std::to_string(sc.slave_id));
        set.slaves.push_back(sc);
    }
    if(set.slaves.empty()) return fail(err, FormatError::ConfigInvalid, "no slave defined");
    out = set;
    return true;
}

bool load_slave_config(const std::string& path, SlaveConfigSet& out, PxldError* err)
{
    std::ifstream f(path, std::ios::binary);
    if(!f) return fail(err, FormatError::IoError, path + ": cannot open");
    std::string js((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if(!parse_slave_config(js, out, err))
    {
        if(err) err->detail = path + ": " + err->detail;
        return false;
    }
    return true;
}

} // namespace pxld
