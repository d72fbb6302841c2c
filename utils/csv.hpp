// utils/csv.hpp
#pragma once
#include <cctype>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // CSV reader for recorded sensor logs. Blank lines and '#' comments are
    // skipped; header names are matched case-insensitively.
    class CsvReader
    {
    public:
        bool open(const std::string &path)
        {
            file_.close();
            file_.clear();
            file_.open(path);
            col_index_.clear();
            header_size_ = 0;
            line_no_ = 0;

            std::vector<std::string> header;
            if (!file_.is_open() || !next_record(header))
                return false;

            header_size_ = header.size();
            for (size_t i = 0; i < header.size(); ++i)
                col_index_[to_lower(header[i])] = static_cast<int>(i);
            return true;
        }

        // Short rows are padded to the header width
        bool read_row(std::vector<std::string> &out)
        {
            if (!next_record(out))
                return false;
            if (out.size() < header_size_)
                out.resize(header_size_);
            return true;
        }

        bool has_col(const std::string &name) const
        {
            return col_index_.count(to_lower(name)) > 0;
        }

        // Empty string for unknown columns
        std::string get(const std::vector<std::string> &row, const std::string &col_name) const
        {
            auto it = col_index_.find(to_lower(col_name));
            if (it == col_index_.end() || static_cast<size_t>(it->second) >= row.size())
                return "";
            return row[static_cast<size_t>(it->second)];
        }

        // Line number of the last record read
        size_t line_no() const { return line_no_; }

        // Throws std::invalid_argument on non-numeric text
        static double to_double(const std::string &s, double default_val = 0.0)
        {
            return s.empty() ? default_val : std::stod(s);
        }

        static std::string to_lower(std::string s)
        {
            for (char &c : s)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return s;
        }

    private:
        bool next_record(std::vector<std::string> &out)
        {
            out.clear();
            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                const size_t first = line.find_first_not_of(" \t\r");
                if (first == std::string::npos || line[first] == '#')
                    continue;

                split(line, out);
                return true;
            }
            return false;
        }

        // Quoted fields may contain commas; "" inside quotes is a literal quote
        static void split(const std::string &line, std::vector<std::string> &out)
        {
            std::string cur;
            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                const char c = line[i];
                if (in_quotes && c == '"' && i + 1 < line.size() && line[i + 1] == '"')
                {
                    cur.push_back('"');
                    ++i;
                }
                else if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    out.push_back(trim(cur));
                    cur.clear();
                }
                else
                {
                    cur.push_back(c);
                }
            }
            out.push_back(trim(cur));
        }

        static std::string trim(const std::string &s)
        {
            const size_t b = s.find_first_not_of(" \t\r");
            if (b == std::string::npos)
                return "";
            const size_t e = s.find_last_not_of(" \t\r");
            return s.substr(b, e - b + 1);
        }

        std::ifstream file_;
        std::unordered_map<std::string, int> col_index_;
        size_t header_size_ = 0;
        size_t line_no_ = 0;
    };

} // namespace utils
