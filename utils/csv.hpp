// utils/csv.hpp
#pragma once
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // CSV reader for the lookup tables, SOH curves and load/PV profiles:
    // - header -> column index
    // - quoted fields
    // - comment (#) / blank line skipping
    // - numeric parsing that reports bad cells instead of guessing
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            if (file_.is_open())
                file_.close();
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();
            line_no_ = 0;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line) || line[0] == '#')
                    continue;

                header_ = parse_line(line);
                for (size_t i = 0; i < header_.size(); ++i)
                {
                    trim_inplace(header_[i]);
                    col_index_[to_lower(header_[i])] = static_cast<int>(i);
                }
                return true;
            }
            return false;
        }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line) || line[0] == '#')
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        // Column lookup is case-insensitive. Returns -1 if absent.
        int col(const std::string &name) const
        {
            auto it = col_index_.find(to_lower(name));
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        bool has_col(const std::string &name) const { return col(name) >= 0; }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        const std::vector<std::string> &header() const { return header_; }

        // Line number of the row returned by the last read_row() (1-based).
        size_t line_no() const { return line_no_; }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            // supports scientific notation (1.00E-07)
            return std::stod(s);
        }

        // Strict variant: the whole cell must be a number.
        static bool try_parse_double(const std::string &s, double &out)
        {
            if (s.empty())
                return false;
            const char *begin = s.c_str();
            char *end = nullptr;
            const double v = std::strtod(begin, &end);
            if (end == begin)
                return false;
            while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
                ++end;
            if (*end != '\0')
                return false;
            out = v;
            return true;
        }

    private:
        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static std::string to_lower(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return out;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else if (c == '"')
                {
                    in_quotes = true;
                }
                else if (c == ',')
                {
                    fields.push_back(cur);
                    cur.clear();
                }
                else if (c != '\r')
                {
                    cur.push_back(c);
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
        size_t line_no_ = 0;
    };

    // Row-oriented CSV writer with a fixed header. Numbers use fixed precision.
    class CsvWriter
    {
    public:
        CsvWriter() = default;

        bool open(const std::string &path, const std::vector<std::string> &columns, int precision = 6)
        {
            if (file_.is_open())
                file_.close();
            file_.open(path, std::ios::out | std::ios::trunc);
            if (!file_.is_open())
                return false;

            columns_ = columns.size();
            for (size_t i = 0; i < columns.size(); ++i)
            {
                if (i)
                    file_ << ',';
                file_ << columns[i];
            }
            file_ << '\n';
            file_ << std::fixed << std::setprecision(precision);
            return true;
        }

        bool is_open() const { return file_.is_open(); }
        size_t columns() const { return columns_; }

        void write_row(const std::vector<double> &values)
        {
            if (values.size() != columns_)
                throw std::invalid_argument("CsvWriter: row has " + std::to_string(values.size()) +
                                            " values, header has " + std::to_string(columns_));
            for (size_t i = 0; i < values.size(); ++i)
            {
                if (i)
                    file_ << ',';
                file_ << values[i];
            }
            file_ << '\n';
        }

        void flush() { file_.flush(); }

        void close()
        {
            if (file_.is_open())
                file_.close();
        }

    private:
        std::ofstream file_;
        size_t columns_ = 0;
    };

} // namespace utils
