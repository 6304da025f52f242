#pragma once
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>

// Prints a config struct as a boxed table. T provides to_tuple() returning
// alternating (label, value) elements.
template <typename T> class ConfigPrinter {
  private:
    static constexpr size_t LABEL_WIDTH = 28;
    static constexpr size_t PADDING = 4;

    template <typename U> static std::string value_to_string(const U &value) {
        if constexpr (std::is_same_v<U, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<U>) {
            std::ostringstream out;
            out << std::fixed << std::setprecision(4) << value;
            return out.str();
        } else if constexpr (std::is_convertible_v<U, std::string>) {
            return std::string(value);
        } else {
            return std::to_string(value);
        }
    }

    template <typename Tuple, size_t... Is> static size_t widest_row(const Tuple &t, std::index_sequence<Is...>) {
        return std::max({size_t(0), (LABEL_WIDTH + value_to_string(std::get<Is * 2 + 1>(t)).length() + PADDING)...});
    }

    template <typename Tuple, size_t... Is> static void print_rows(std::ostream &os, const Tuple &t, size_t box_width, std::index_sequence<Is...>) {
        (print_row(os, std::get<Is * 2>(t), value_to_string(std::get<Is * 2 + 1>(t)), box_width), ...);
    }

    static void print_row(std::ostream &os, const std::string &label, const std::string &value, size_t box_width) {
        os << "| " << std::left << std::setw(LABEL_WIDTH) << label << ": " << std::setw(box_width - LABEL_WIDTH - PADDING) << value << "|" << std::endl;
    }

  public:
    static std::string demangle(const char *name) {
        int status = 0;
        std::unique_ptr<char, void (*)(void *)> res{abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free};
        return (status == 0) ? res.get() : name;
    }

    static void print(std::ostream &os, const T &config) { print(os, demangle(typeid(T).name()), config); }

    static void print(std::ostream &os, const std::string &title, const T &config) {
        auto tuple = config.to_tuple();
        constexpr size_t num_rows = std::tuple_size_v<decltype(tuple)> / 2;

        size_t box_width = std::max({widest_row(tuple, std::make_index_sequence<num_rows>{}), title.length() + PADDING, LABEL_WIDTH + PADDING});
        std::string rule = "+" + std::string(box_width - 1, '-') + "+";

        os << rule << std::endl;
        os << "| " << std::left << std::setw(box_width - 2) << title << "|" << std::endl;
        os << rule << std::endl;
        print_rows(os, tuple, box_width, std::make_index_sequence<num_rows>{});
        os << rule << std::endl << std::endl;
    }
};
