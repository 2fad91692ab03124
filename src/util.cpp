// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.h"

#include "utilstrencodings.h"

#include <assert.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <stdio.h>
#include <stdlib.h>
#include <typeinfo>

static std::map<std::string, std::string> mapArgs;
static std::map<std::string, std::vector<std::string> > mapMultiArgs;
static std::vector<std::string> vPositionalArgs;
static std::mutex cs_args;

bool fDebug = false;
bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/**
 * LogPrintf() has been broken a couple of times now
 * by well-meaning people adding mutexes in the most straightforward way.
 * It breaks because it may be called by global destructors during shutdown.
 * Since the order of destruction of static/global objects is undefined,
 * defining a mutex as a global object doesn't work (the mutex gets
 * destroyed, and then some later destructor calls OutputDebugStringF,
 * maybe indirectly, and you get a core dump at shutdown trying to lock
 * the mutex).
 */
static std::mutex* mutexDebugLog = NULL;
static std::once_flag debugPrintInitFlag;
static FILE* fileout = NULL;

/** Categories enabled with -debug=<category>; empty string means all. */
static std::unique_ptr<std::set<std::string> > setCategories;
static std::mutex cs_categories;

static void DebugPrintInit()
{
    assert(mutexDebugLog == NULL);
    mutexDebugLog = new std::mutex();
}

void OpenDebugLog()
{
    std::call_once(debugPrintInitFlag, &DebugPrintInit);
    std::lock_guard<std::mutex> scoped_lock(*mutexDebugLog);

    if (fileout != NULL)
        return;
    std::string strPath = GetArg("-debuglogfile", "");
    if (strPath.empty())
        return;
    fileout = fopen(strPath.c_str(), "a");
    if (fileout)
        setbuf(fileout, NULL); // unbuffered
}

void InitLogging()
{
    std::lock_guard<std::mutex> lock(cs_categories);
    std::set<std::string> categories;
    {
        std::lock_guard<std::mutex> argsLock(cs_args);
        if (mapMultiArgs.count("-debug")) {
            for (const std::string& cat : mapMultiArgs.at("-debug")) {
                if (cat == "0" || cat == "none")
                    continue;
                categories.insert(cat == "1" ? std::string() : cat);
            }
        }
    }
    fDebug = !categories.empty();
    setCategories.reset(new std::set<std::string>(categories));
}

bool LogAcceptCategory(const char* category)
{
    if (category == NULL)
        return true;
    if (!fDebug)
        return false;

    std::lock_guard<std::mutex> lock(cs_categories);
    if (!setCategories)
        return false;
    // if not debugging everything and not debugging specific category, LogPrint does nothing.
    return setCategories->count(std::string("")) != 0 ||
           setCategories->count(std::string(category)) != 0;
}

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline. Initialize it to true, and hold it, in the calling context.
 */
static std::string LogTimestampStr(const std::string &str, std::atomic_bool *fStartedNewLine)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (*fStartedNewLine) {
        strStamped = DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()) + ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        *fStartedNewLine = true;
    else
        *fStartedNewLine = false;

    return strStamped;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written
    static std::atomic_bool fStartedNewLine(true);

    std::string strTimestamped = LogTimestampStr(str, &fStartedNewLine);

    if (fPrintToConsole)
    {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fPrintToDebugLog)
    {
        std::call_once(debugPrintInitFlag, &DebugPrintInit);
        std::lock_guard<std::mutex> scoped_lock(*mutexDebugLog);

        if (fileout != NULL)
            ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
    }
    return ret;
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

void ParseParameters(int argc, const char* const argv[])
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
    vPositionalArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        // A lone "-" names stdin and is positional.
        if (str.empty() || str[0] != '-' || str == "-") {
            vPositionalArgs.push_back(argv[i]);
            continue;
        }

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue.empty() ? std::string("1") : strValue);
    }
}

void ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
    vPositionalArgs.clear();
}

bool IsArgSet(const std::string& strArg)
{
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg);
}

std::string GetArg(const std::string& strArg, const std::string& strDefault)
{
    std::lock_guard<std::mutex> lock(cs_args);
    if (mapArgs.count(strArg))
        return mapArgs[strArg];
    return strDefault;
}

int64_t GetArg(const std::string& strArg, int64_t nDefault)
{
    std::lock_guard<std::mutex> lock(cs_args);
    if (mapArgs.count(strArg))
        return atoi64(mapArgs[strArg]);
    return nDefault;
}

bool GetBoolArg(const std::string& strArg, bool fDefault)
{
    std::lock_guard<std::mutex> lock(cs_args);
    if (mapArgs.count(strArg))
        return InterpretBool(mapArgs[strArg]);
    return fDefault;
}

bool SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    if (mapArgs.count(strArg))
        return false;
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg].push_back(strValue);
    return true;
}

bool SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

const std::vector<std::string>& GetPositionalArgs()
{
    return vPositionalArgs;
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    return std::string(optIndent,' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent,' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}

static std::string FormatException(const std::exception* pex, const char* pszThread)
{
    if (pex)
        return tfm::format(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "stealth", pszThread);
    else
        return tfm::format(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", "stealth", pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}
