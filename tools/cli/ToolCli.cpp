#include "ToolCli.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>

namespace DL::Tools {

ToolCli::ToolCli() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void ToolCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ToolCli::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void ToolCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ToolCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ToolCli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_optional = option.value_optional;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ToolCli::add_size(std::string_view name, SizeOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return stored + " requires a value";
        }
        std::size_t value = 0;
        auto begin = token->data();
        auto end = begin + token->size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " must be a non-negative integer";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ToolCli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        had_error_ = true;
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

namespace {

struct SplitToken {
    std::string_view                name;
    std::optional<std::string_view> value;
};

auto split_token(std::string_view token) -> SplitToken {
    auto const equals = token.find('=');
    if (equals == std::string_view::npos) {
        return {token, std::nullopt};
    }
    return {token.substr(0, equals), token.substr(equals + 1)};
}

} // namespace

bool ToolCli::parse(int argc, char** argv) {
    had_error_ = false;
    auto fail = [this](std::string_view message) {
        log_error(message);
        had_error_ = true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view const token = argv[i];
        auto [name, value]           = split_token(token);

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(token)) {
                had_error_ = true;
            }
            continue;
        }

        if (!entry->expects_value) {
            if (value) {
                fail(entry->name + " does not take a value");
            } else if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        // "--name value" form: the next token is the value unless it is another option.
        if (!value && (i + 1) < argc && !looks_like_option(argv[i + 1])) {
            value = std::string_view{argv[++i]};
        }
        if (!value && !entry->value_optional) {
            fail(entry->name + " requires a value");
            continue;
        }
        if (!entry->value_handler) {
            continue;
        }
        if (auto error = entry->value_handler(value)) {
            fail(*error);
        }
    }
    return !had_error_;
}

bool ToolCli::had_errors() const {
    return had_error_;
}

ToolCli::OptionEntry* ToolCli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ToolCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void ToolCli::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"displaylist"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool ToolCli::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

} // namespace DL::Tools
