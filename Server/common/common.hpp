#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

using namespace std;

namespace common
{
    inline string now()
    {
        using namespace chrono;
        time_t t = system_clock::to_time_t(system_clock::now());
        tm local{};
        localtime_r(&t, &local);

        char buf[16];
        strftime(buf, sizeof(buf), "%H:%M:%S", &local);
        return buf;
    }
    inline mutex& log_mutex()
    {
        static mutex m;
        return m;
    }
    inline void log(const char* tag, const string& msg)
    {
        lock_guard<mutex> lk(log_mutex());
        cout << "[" << now() << "][" << tag << "] " << msg << endl;
    }
    inline void warn(const char* tag, const string& msg)
    {
        lock_guard<mutex> lk(log_mutex());
        cerr << "[" << now() << "][" << tag << "][WARN] " << msg << endl;
    }
    inline int to_int(const char* s, int d)
    {
        if (!s)
            return d;
        try
        {
            return stoi(s);
        }
        catch (const exception&)
        {
            return d;
        }
    }
    inline string lower(string s)
    {
        transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
        return s;
    }
    inline string trim(const string& s)
    {
        auto b = s.find_first_not_of(" \t\r\n");
        if (b == string::npos)
            return "";
        auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }
    inline string join(const auto& parts, const string& sep)
    {
        string out;
        bool first = true;
        for (const auto& p : parts)
        {
            if (!first)
                out += sep;
            out += p;
            first = false;
        }
        return out;
    }
}
