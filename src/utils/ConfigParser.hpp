#pragma once

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class Status {
  public:
    enum class Code { kOk, kInvalidArgument, kNotFound };

    Status() = default;

    static Status OK() { return Status(); }
    static Status InvalidArgument(const std::string &msg) { return Status(Code::kInvalidArgument, msg); }
    static Status NotFound(const std::string &msg) { return Status(Code::kNotFound, msg); }

    bool IsOK() const { return m_code == Code::kOk; }
    Code code() const { return m_code; }

    std::string ToString() const {
        switch (m_code) {
        case Code::kOk: return "OK";
        case Code::kInvalidArgument: return "Invalid argument: " + m_msg;
        case Code::kNotFound: return "Not found: " + m_msg;
        }
        return m_msg;
    }

  private:
    Status(Code code, std::string msg) : m_code(code), m_msg(std::move(msg)) {}

    Code m_code = Code::kOk;
    std::string m_msg;
};

class Parameter {
  public:
    Parameter(std::string name, std::string default_value, bool required, std::string description)
        : m_name(std::move(name)), m_default_value(std::move(default_value)), m_required(required), m_description(std::move(description)) {}
    virtual ~Parameter() = default;

    virtual Status Set(const std::string &value) = 0;
    virtual std::string TypeName() const = 0;
    virtual bool IsFlag() const { return false; }

    const std::string &name() const { return m_name; }
    const std::string &default_value() const { return m_default_value; }
    const std::string &description() const { return m_description; }
    bool required() const { return m_required; }

  private:
    std::string m_name;
    std::string m_default_value;
    bool m_required;
    std::string m_description;
};

namespace config_parser_detail {

inline Status parse_unsigned(const std::string &name, const std::string &value, uint64_t max, uint64_t &out) {
    if (value.empty() || value[0] == '-' || value[0] == '+') return Status::InvalidArgument(name + " expects an unsigned integer, got '" + value + "'");
    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos, 10);
    } catch (const std::exception &) {
        return Status::InvalidArgument(name + " expects an unsigned integer, got '" + value + "'");
    }
    if (pos != value.size()) return Status::InvalidArgument(name + " expects an unsigned integer, got '" + value + "'");
    if (parsed > max) return Status::InvalidArgument(name + " is out of range: " + value);
    out = static_cast<uint64_t>(parsed);
    return Status::OK();
}

}   // namespace config_parser_detail

class UnsignedInt32Parameter : public Parameter {
  public:
    UnsignedInt32Parameter(const std::string &name, const std::string &default_value, uint32_t *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Set(const std::string &value) override {
        uint64_t parsed = 0;
        Status s = config_parser_detail::parse_unsigned(name(), value, std::numeric_limits<uint32_t>::max(), parsed);
        if (!s.IsOK()) return s;
        *m_target = static_cast<uint32_t>(parsed);
        return Status::OK();
    }
    std::string TypeName() const override { return "uint32"; }

  private:
    uint32_t *m_target;
};

class UnsignedInt64Parameter : public Parameter {
  public:
    UnsignedInt64Parameter(const std::string &name, const std::string &default_value, uint64_t *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Set(const std::string &value) override { return config_parser_detail::parse_unsigned(name(), value, std::numeric_limits<uint64_t>::max(), *m_target); }
    std::string TypeName() const override { return "uint64"; }

  private:
    uint64_t *m_target;
};

class FloatParameter : public Parameter {
  public:
    FloatParameter(const std::string &name, const std::string &default_value, float *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Set(const std::string &value) override {
        size_t pos = 0;
        float parsed = 0.0f;
        try {
            parsed = std::stof(value, &pos);
        } catch (const std::exception &) {
            return Status::InvalidArgument(name() + " expects a number, got '" + value + "'");
        }
        if (pos != value.size()) return Status::InvalidArgument(name() + " expects a number, got '" + value + "'");
        *m_target = parsed;
        return Status::OK();
    }
    std::string TypeName() const override { return "float"; }

  private:
    float *m_target;
};

class StringParameter : public Parameter {
  public:
    StringParameter(const std::string &name, const std::string &default_value, std::string *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Set(const std::string &value) override {
        *m_target = value;
        return Status::OK();
    }
    std::string TypeName() const override { return "string"; }

  private:
    std::string *m_target;
};

class BooleanParameter : public Parameter {
  public:
    BooleanParameter(const std::string &name, const std::string &default_value, bool *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Set(const std::string &value) override {
        if (value == "true" || value == "1" || value == "yes") {
            *m_target = true;
        } else if (value == "false" || value == "0" || value == "no") {
            *m_target = false;
        } else {
            return Status::InvalidArgument(name() + " expects true or false, got '" + value + "'");
        }
        return Status::OK();
    }
    std::string TypeName() const override { return "bool"; }
    bool IsFlag() const override { return true; }

  private:
    bool *m_target;
};

// Registry of typed parameters, filled from "--name=value" / "--name value"
// command-line arguments. Defaults are applied before parsing.
class ConfigParser {
  public:
    // Takes ownership of the parameter.
    void AddParameter(Parameter *parameter) {
        std::unique_ptr<Parameter> owned(parameter);
        const std::string name = owned->name();
        if (m_index.count(name)) throw std::invalid_argument("Duplicate config parameter: " + name);
        m_index[name] = m_parameters.size();
        m_parameters.push_back(std::move(owned));
    }

    Status ParseCommandLine(int argc, const char *const *argv) {
        for (const auto &p : m_parameters) {
            Status s = p->Set(p->default_value());
            if (!s.IsOK()) return s;
        }

        std::map<std::string, bool> seen;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) return Status::InvalidArgument("Unexpected argument '" + arg + "'");
            arg = arg.substr(2);

            std::string name = arg;
            std::string value;
            bool has_value = false;
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                value = arg.substr(eq + 1);
                has_value = true;
            }

            auto it = m_index.find(name);
            if (it == m_index.end()) return Status::NotFound("Unknown parameter --" + name);
            Parameter &p = *m_parameters[it->second];

            if (!has_value) {
                bool next_is_value = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
                if (next_is_value) {
                    value = argv[++i];
                } else if (p.IsFlag()) {
                    value = "true";
                } else {
                    return Status::InvalidArgument("Missing value for --" + name);
                }
            }

            Status s = p.Set(value);
            if (!s.IsOK()) return s;
            seen[name] = true;
        }

        for (const auto &p : m_parameters) {
            if (p->required() && !seen.count(p->name())) return Status::InvalidArgument("Missing required parameter --" + p->name());
        }
        return Status::OK();
    }

    Status ParseCommandLine(int argc, char **argv) { return ParseCommandLine(argc, const_cast<const char *const *>(argv)); }

    void PrintUsage(std::ostream &os = std::cout) const {
        os << "Options:" << std::endl;
        for (const auto &p : m_parameters) {
            os << "  --" << p->name() << " <" << p->TypeName() << ">";
            if (p->required()) os << " (required)";
            os << std::endl << "      " << p->description() << " [default: " << p->default_value() << "]" << std::endl;
        }
    }

    void PrintMarkdown(std::ostream &os = std::cout) const {
        os << "| Parameter | Type | Default | Required | Description |" << std::endl;
        os << "|---|---|---|---|---|" << std::endl;
        for (const auto &p : m_parameters) {
            os << "| `--" << p->name() << "` | " << p->TypeName() << " | `" << p->default_value() << "` | " << (p->required() ? "yes" : "no") << " | " << p->description() << " |"
               << std::endl;
        }
    }

    size_t size() const { return m_parameters.size(); }

  private:
    std::vector<std::unique_ptr<Parameter>> m_parameters;
    std::map<std::string, size_t> m_index;
};
