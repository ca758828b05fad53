#include <iostream>
#include <sstream>
#include <fstream>
#include <deque>
#include <tuple>
#include <dirent.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include "time.h"
#include <syslog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "PipeExec.h"
#include "exception.h"

using namespace pcrepp;

struct global_vars GLOBALS;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


/*******************************************************************************
 * log(message)
 *
 * Append "<timestamp>: message" to the run log and mirror it to syslog.
 * The run log is append-only; it's never truncated here. Returns the message
 * so calls can be nested inside SCREENERR().
 *******************************************************************************/
string log(string message) {
    string flatMessage = commafy(message);
    syslog(LOG_NOTICE, "%s", flatMessage.c_str());

    if (GLOBALS.logFile.length()) {
        ofstream logFile;
        logFile.open(GLOBALS.logFile, ios::app);

        if (logFile.is_open()) {
            logFile << timeString(time(NULL), "%a %b %d %H:%M:%S %Z %Y") << ": " << flatMessage << endl;
            logFile.close();
        }
    }

    return message;
}


string timeDiffSingle(time_t seconds, int maxUnits) {
    auto offset = seconds;
    int unitsUsed = 0;
    string result;
    vector<pair<unsigned long, string>> units {
        { 86400, "day" },
        { 3600, "hour" },
        { 60, "minute" },
        { 1, "second" } };

    for (auto &unit: units) {
        if (offset >= (time_t)unit.first) {
            unsigned long value = offset / unit.first;
            offset %= unit.first;

            result += (result.length() ? ", " : "") + to_string(value) + " " + unit.second + (value == 1 ? "" : "s");

            if (++unitsUsed == maxUnits)
                break;
        }
    }

    return (result.length() ? result : "0 seconds");
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;
    s.dir = s.file = "";

    if (path.length() > 1) {
        auto pos = path.rfind("/");

        if (pos == string::npos) {
            s.dir = ".";
            s.file = path;
        }
        else {
            s.file = path.substr(pos + 1);
            s.dir = pos ? path.substr(0, pos) : "/";
        }
    }
    else
        if (path.length()) {
            if (path[0] == '/')
                s.dir = "/";
            else {
                s.dir = ".";
                s.file = path;
            }
        }

    return s;
}


// lowercase hex SHA-256 of a file's contents; "" if it can't be read
string sha256File(string filename) {
    FILE *inputFile;

    if ((inputFile = fopen(filename.c_str(), "rb")) != NULL) {
        unsigned char data[65536];
        unsigned long bytesRead;
        EVP_MD_CTX *shaContext;
        unsigned char shaDigest[EVP_MAX_MD_SIZE];
        unsigned int shaDigestLen = 0;
        bool readError;

        shaContext = EVP_MD_CTX_new();
        EVP_DigestInit_ex(shaContext, EVP_sha256(), NULL);

        while ((bytesRead = fread(data, 1, sizeof(data), inputFile)) != 0)
            EVP_DigestUpdate(shaContext, data, bytesRead);

        readError = ferror(inputFile);
        fclose(inputFile);
        EVP_DigestFinal_ex(shaContext, shaDigest, &shaDigestLen);
        EVP_MD_CTX_free(shaContext);

        if (readError)
            return "";

        char tempStr[EVP_MAX_MD_SIZE * 2 + 1];
        for (unsigned int i = 0; i < shaDigestLen; i++)
            snprintf(tempStr+(2*i), 3, "%02x", shaDigest[i]);
        tempStr[shaDigestLen * 2] = 0;

        return(tempStr);
    }

    return "";
}


// 1536 -> "1.5K"; bytes are shown without a unit or decimals
string approximate(size_t size) {
    const char units[] = "BKMGTPEZY";
    long double scaled = size;
    unsigned int index = 0;

    while (scaled >= 1024 && index + 1 < strlen(units)) {
        scaled /= 1024;
        ++index;
    }

    char buffer[64];
    if (index)
        snprintf(buffer, sizeof(buffer), "%.1Lf%c", scaled, units[index]);
    else
        snprintf(buffer, sizeof(buffer), "%zu", size);

    return buffer;
}


size_t approx2bytes(string approx) {
    vector<string> units = { "B", "K", "M", "G", "T", "P", "E", "Z", "Y" };
    Pcre reg("^((?:\\d|\\.)+)\\s*(?:(\\w)(?:[Bb]$|$)|$)");

    if (approx.length()) {
        if (reg.search(approx)) {

            // was a numeric value and a unit specified?
            if (reg.matches() > 1) {

                // save the two pieces
                auto numericVal = stof(reg.get_match(0));
                string unit = reg.get_match(1);

                // capitalize the units to match the lookup in the vector
                for (auto &c: unit) c = toupper(c);

                // lookup the supplied unit in the vector
                auto it = find(units.begin(), units.end(), unit);

                if (it != units.end()) {
                    // determine its index and calculate the result
                    auto index = it - units.begin();
                    return floor(pow(1024, index) * numericVal);
                }
            }
            // was just a numeric value specified?
            else
                if (reg.matches() > 0) {
                    return floor(stof(reg.get_match(0)));
            }
        }
    }
    else
        return 0;

    throw std::runtime_error("approx2bytes - error parsing size from string '" + approx + "'");
}


// mkdir -p; returns 0 or the failing mkdir's result
int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;
    string path = dir[0] == '/' ? "" : ".";

    if (!stat(dir.c_str(), &statBuf))
        return 0;

    for (auto &piece: splitOnChar(dir, '/')) {
        if (!piece.length())
            continue;

        path += "/" + piece;

        if (stat(path.c_str(), &statBuf) && mkdir(path.c_str(), mode) && errno != EEXIST)
            return -1;
    }

    return 0;
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace(*start))
        start++;

    if (start == s.end())
        return "";

    auto end = s.end();
    do {
        end--;
    } while (distance(start, end) > 0 && isspace(*end));

    return string(start, end + 1);
}


string trimQuotes(string s, bool unEscape) {
    string result = s;

    if (result.length() > 1 && (result.front() == '\'' || result.front() == '\"') && result.front() == result.back())
        result = result.substr(1, result.length() - 2);

    if (unEscape) {
        size_t altpos;  // remove any remaining backslashes
        while ((altpos = result.find("\\")) != string::npos)
            result.erase(altpos, 1);
    }

    return result;
}


// the RE matches the tokens themselves, not the separators
static void splitOnRegex(vector<string>& result, string data, Pcre& re, bool trimQ, bool unEscape) {
    Pcre regex(re);
    string temp;
    int pos = 0;

    while (pos <= (int)data.length() && regex.search(data, pos)) {
        pos = regex.get_match_end(0);
        ++pos;
        temp = regex.get_match(0);

        if (unEscape) {
            size_t altpos;  // remove any remaining backslashes
            while ((altpos = temp.find("\\")) != string::npos)
                temp.erase(altpos, 1);
        }

        result.push_back(trimQ ? trimQuotes(temp) : temp);
    }
}


// split a string into a vector on pipes, except where quoted or escaped
vector<string> string2vectorOnPipe(string data, bool trimQ, bool unEscape) {
    Pcre regex("((?:[^\'\"|]*([\'\"]).+?(?<!\\\\)\\g2[^\'\"|]*)|(?:[^|]|(?:(?<=\\\\)\\|))+)", "g");
    vector<string> result;
    splitOnRegex(result, data, regex, trimQ, unEscape);
    return result;
}


vector<string> splitOnChar(string data, char delimiter) {
    vector<string> result;
    stringstream tokenizer(data);
    string tempStr;

    while (getline(tokenizer, tempStr, delimiter))
        result.push_back(tempStr);

    return result;
}


string locateBinary(string app) {
    // if a path is specified try it
    if (app.find("/") != string::npos) {
        if (!access(app.c_str(), X_OK))
            return(app);
    }

    // grab the binary name as the last delimited element given
    auto appBinary = pathSplit(app).file;

    // try to find the binary in each component of the path
    for (auto piece: splitOnChar(cppgetenv("PATH"), ':')) {
        string binary = string(piece) + "/" + appBinary;
        if (!access(binary.c_str(), X_OK))
            return binary;
    }

    // give up
    log("unable to locate/execute '" + app + "' command");
    return "";
}


bool str2bool(string text) {
    Pcre regTrue("(^\\s*(t|true|y|yes|1)\\s*$)|(^\\s*$)", "i");
    // a blank value (^\\s*$) is parsed as true to support someone writing just the directive name in the config file.
    // e.g. these two lines would be interpreted identically:
    //      notifystart: true
    //      notifystart

    return(regTrue.search(text));
}


bool sendEmail(string from, string recipients, string subject, string message) {
    string headers = "From: " + from + "\nTo: " + recipients + "\nContent-Type: text/plain; charset=UTF-8\nSubject: " + subject + "\n\n";
    string bin = locateBinary("/usr/sbin/sendmail");
    vector<string> command;

    if (bin.length())
        command = { bin, "-f", from, recipients };
    else {
        bin = locateBinary("mail");
        if (!bin.length())
            return false;

        command = { bin, "-s", subject, recipients };
        headers = "";
    }

    PipeExec mail(command, "sendmail");
    mail.execute(true, poDiscard);

    if (headers.length())
        mail.writeProc(headers);

    mail.writeProc(message + "\n");
    mail.closeWrite();

    return (mail.wait() == 0);
}


string blockp(string data, int width) {
    char cstr[2000];
    snprintf(cstr, sizeof(cstr), string(string("%") + to_string(width) + "s").c_str(), data.c_str());
    return(cstr);
}


/*******************************************************************************
 * processDirectory(path, callback, passData, includeTopDir)
 *
 * Walk path calling callback on every entry beneath it.  A directory is only
 * handed to the callback after everything inside it, so the callback may
 * remove it.  A callback returning false ends the walk.  Given a plain file
 * the callback sees just that file.  Returns "" on success or the (logged)
 * error.
 *******************************************************************************/
string processDirectory(string path, bool (*callback)(pdCallbackData&), void *passData, bool includeTopDir) {
    pdCallbackData entry;
    entry.dataPtr = passData;
    entry.filename = path;
    entry.depth = 0;

    if (lstat(path.c_str(), &entry.statData))
        return "error: stat failed for " + path + errtext();

    if (!S_ISDIR(entry.statData.st_mode)) {
        callback(entry);
        return "";
    }

    // (directory, depth, already expanded)
    vector<tuple<string, unsigned int, bool>> pending = { make_tuple(path, 0, false) };

    while (pending.size()) {
        auto [dir, depth, expanded] = pending.back();

        if (expanded) {
            pending.pop_back();

            if (depth || includeTopDir) {
                entry.filename = dir;
                entry.depth = depth;
                if (lstat(dir.c_str(), &entry.statData) || !callback(entry))
                    return "";
            }

            continue;
        }

        get<2>(pending.back()) = true;

        DIR *dirPtr = opendir(dir.c_str());
        if (dirPtr == NULL)
            return log("error: unable to open " + dir + errtext());

        struct dirent *dirEntry;
        while ((dirEntry = readdir(dirPtr)) != NULL) {
            if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                continue;

            entry.filename = slashConcat(dir, dirEntry->d_name);
            entry.depth = depth + 1;

            if (lstat(entry.filename.c_str(), &entry.statData))
                continue;

            if (S_ISDIR(entry.statData.st_mode))
                pending.push_back(make_tuple(entry.filename, depth + 1, false));
            else
                if (!callback(entry)) {
                    closedir(dirPtr);
                    return "";
                }
        }

        closedir(dirPtr);
    }

    return "";
}


bool removeCallback(pdCallbackData &entry) {
    return (S_ISDIR(entry.statData.st_mode) ? !rmdir(entry.filename.c_str()) : !unlink(entry.filename.c_str()));
}


bool rmrf(string directory, bool includeTopDir) {
    return (processDirectory(directory, removeCallback, NULL, includeTopDir) == "");
}


bool sizeCallback(pdCallbackData &entry) {
    if (S_ISREG(entry.statData.st_mode))
        *(size_t*)entry.dataPtr += entry.statData.st_size;

    return true;
}


size_t dus(string path) {
    size_t total = 0;
    processDirectory(path, sizeCallback, &total);
    return total;
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (lstat(name.c_str(), &statBuffer) == 0);
}


long long fileSize(string filename) {
    struct stat statBuffer;
    return (stat(filename.c_str(), &statBuffer) ? -1 : (long long)statBuffer.st_size);
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


// replace carriage-returns with commas
string commafy(string data) {
    if (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos = 0;
    while((pos = data.find("\n", pos)) != std::string::npos) {
        data.replace(pos, 1, ", ");
        pos += 2;
    }
    return data;
}


string hostname() {
    static string internalHostname;

    if (!internalHostname.length()) {
        char hname[256];
        if (!gethostname(hname, sizeof(hname))) {
            hname[sizeof(hname) - 1] = 0;
            internalHostname = hname;
        }
        else
            log("error: unable to lookup hostname" + errtext());
    }

    return internalHostname;
}


string escapeRegex(string data) {
    string result;

    for (auto c: data) {
        if (strchr("\\^$.|?*+()[]{}-/", c))
            result += '\\';
        result += c;
    }

    return result;
}


string timeString(time_t when, string format) {
    char text[100];
    struct tm localTime;

    localtime_r(&when, &localTime);
    strftime(text, sizeof(text) - 1, format.c_str(), &localTime);
    return(text);
}


// last n lines of a file (tail -n)
vector<string> tailFile(string filename, unsigned int lines) {
    ifstream inFile;
    deque<string> window;
    string dataLine;

    inFile.open(filename);
    if (!inFile.is_open())
        throw VBException("unable to read " + filename + errtext());

    while (getline(inFile, dataLine)) {
        window.push_back(dataLine);

        if (window.size() > lines)
            window.pop_front();
    }

    inFile.close();
    return vector<string>(window.begin(), window.end());
}

