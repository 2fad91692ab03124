// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key.h"
#include "pubkey.h"
#include "util.h"
#include "utilstrencodings.h"
#include "stealth/api.h"
#include "stealth/metadata.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdio.h>
#include <stdlib.h>

#include <boost/optional.hpp>

using namespace stealth;

static const bool DEFAULT_PRINTTOCONSOLE = false;

static std::string HelpMessageCli()
{
    std::string strUsage;
    strUsage += "Usage:\n";
    strUsage += "  stealth-cli [options] generatekeys\n";
    strUsage += "  stealth-cli [options] generateaddress <viewingpubkey> [spendingpubkey] [ephemeralprivkey]\n";
    strUsage += "  stealth-cli [options] scan <viewingprivkey> <viewingpubkey> <metadatafile|->\n";
    strUsage += "  stealth-cli [options] derivespendkey <spendingprivkey> <viewingprivkey> <stealthaddress> <ephemeralpubkey> [viewingpubkey]\n";
    strUsage += "  stealth-cli [options] createmetadata <stealthaddress> <ephemeralpubkey> <viewtag>\n";
    strUsage += "  stealth-cli [options] demo\n\n";

    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-network=<name>", strprintf("Network name recorded in created metadata (default: %s)", DefaultNetwork));
    strUsage += HelpMessageOpt("-scanthreads=<n>", strprintf("Number of threads used to scan metadata (0 = one per core, default: %u)", DefaultScanThreads));
    strUsage += HelpMessageOpt("-checksum", "Print addresses in mixed-case checksum form");

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: stealth.");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Append log output to <file>");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", strprintf("Send trace/debug info to console (default: %u)", DEFAULT_PRINTTOCONSOLE));
    return strUsage;
}

static std::string FormatAddress(CAccountID const & address)
{
    return GetBoolArg("-checksum", false) ? address.ToChecksumString() : address.ToString();
}

static UniValue AddressToJSON(CStealthAddress const & address)
{
    UniValue obj = StealthAddressToJSON(address);
    if (GetBoolArg("-checksum", false))
        obj.pushKV("checksumAddress", address.getAddress().ToChecksumString());
    return obj;
}

static std::string ReadMetadataDocument(std::string const & path)
{
    if (path == "-")
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error(strprintf("Cannot open metadata file %s", path));
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static boost::optional<std::string> OptionalArg(std::vector<std::string> const & args, size_t pos)
{
    if (args.size() > pos)
        return args[pos];
    return boost::none;
}

static unsigned int ScanThreads()
{
    int64_t nThreads = GetArg("-scanthreads", (int64_t)DefaultScanThreads);
    if (nThreads < 0)
        throw std::runtime_error("-scanthreads must not be negative");
    return (unsigned int)nThreads;
}

static UniValue CommandGenerateKeys()
{
    CStealthKeys keys = GenerateStealthKeys();
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("spendingPrivateKey", HexStrPrefixed(keys.getSpending().getPrivKey()));
    obj.pushKV("viewingPrivateKey", HexStrPrefixed(keys.getViewing().getPrivKey()));
    obj.pushKV("spendingPublicKey", HexStrPrefixed(keys.getSpending().getPubKey()));
    obj.pushKV("viewingPublicKey", HexStrPrefixed(keys.getViewing().getPubKey()));
    return obj;
}

static UniValue CommandGenerateAddress(std::vector<std::string> const & args)
{
    if (args.size() < 2 || args.size() > 4)
        throw std::runtime_error("generateaddress <viewingpubkey> [spendingpubkey] [ephemeralprivkey]");
    CStealthAddress address = GenerateStealthAddress(args[1], OptionalArg(args, 2), OptionalArg(args, 3));
    return AddressToJSON(address);
}

static UniValue CommandScan(std::vector<std::string> const & args)
{
    if (args.size() != 4)
        throw std::runtime_error("scan <viewingprivkey> <viewingpubkey> <metadatafile|->");
    std::vector<CStealthAddress> found;
    if (!ScanMetadataDocument(args[1], args[2], ReadMetadataDocument(args[3]), found, ScanThreads()))
        throw std::runtime_error("Metadata document must be a JSON array of metadata objects");

    UniValue arr(UniValue::VARR);
    for (CStealthAddress const & address : found)
        arr.push_back(AddressToJSON(address));
    return arr;
}

static UniValue CommandDeriveSpendKey(std::vector<std::string> const & args)
{
    if (args.size() < 5 || args.size() > 6)
        throw std::runtime_error("derivespendkey <spendingprivkey> <viewingprivkey> <stealthaddress> <ephemeralpubkey> [viewingpubkey]");
    CKey key = DeriveStealthSpendingKey(args[1], args[2], args[3], args[4], OptionalArg(args, 5));
    CAccountID address;
    GetAccountID(key.GetPubKey(), address);
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", FormatAddress(address));
    obj.pushKV("privateKey", HexStrPrefixed(key));
    return obj;
}

static UniValue CommandCreateMetadata(std::vector<std::string> const & args)
{
    if (args.size() != 4)
        throw std::runtime_error("createmetadata <stealthaddress> <ephemeralpubkey> <viewtag>");
    CStealthAddress address = StealthAddressFromParts(args[1], args[2], args[3]);
    return MetadataToJSON(CreateStealthMetadata(address, GetArg("-network", DefaultNetwork)));
}

/** Walk through the whole receive flow with freshly generated keys. */
static int RunDemo()
{
    std::cout << "=== Stealth address demo ===" << std::endl << std::endl;

    std::cout << "1. Receiver generates stealth keys" << std::endl;
    CStealthKeys keys = GenerateStealthKeys();
    std::string const viewingPub = HexStrPrefixed(keys.getViewing().getPubKey());
    std::string const spendingPub = HexStrPrefixed(keys.getSpending().getPubKey());
    std::cout << "   viewing public key:  " << viewingPub << std::endl;
    std::cout << "   spending public key: " << spendingPub << std::endl << std::endl;

    std::cout << "2. Sender derives a stealth address for the receiver" << std::endl;
    CStealthAddress address = GenerateStealthAddress(viewingPub, spendingPub);
    std::cout << "   stealth address:      " << FormatAddress(address.getAddress()) << std::endl;
    std::cout << "   ephemeral public key: " << HexStrPrefixed(address.getEphemeralPubKey()) << std::endl;
    std::cout << "   view tag:             " << address.getViewTagHex() << std::endl << std::endl;

    std::vector<CStealthMetadata> published;
    published.push_back(CreateStealthMetadata(address, GetArg("-network", DefaultNetwork)));

    std::cout << "3. Receiver scans published metadata" << std::endl;
    std::vector<CStealthAddress> found = ScanStealthAddresses(
            HexStrPrefixed(keys.getViewing().getPrivKey()), viewingPub, published, ScanThreads());
    std::cout << "   found " << found.size() << " address(es)" << std::endl;
    if (found.empty()) {
        std::cerr << "Failed to discover the stealth address" << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "   discovered: " << FormatAddress(found[0].getAddress()) << std::endl << std::endl;

    std::cout << "4. Receiver derives the spending key" << std::endl;
    CKey key = DeriveStealthSpendingKey(
            HexStrPrefixed(keys.getSpending().getPrivKey()),
            HexStrPrefixed(keys.getViewing().getPrivKey()),
            found[0].getAddress().ToString(),
            HexStrPrefixed(found[0].getEphemeralPubKey()),
            viewingPub);
    std::cout << "   spending key: " << HexStrPrefixed(key) << std::endl;
    std::cout << "Success, the receiver controls the stealth address." << std::endl;
    return EXIT_SUCCESS;
}

static int AppInitCli(int argc, char* argv[])
{
    ParseParameters(argc, argv);
    std::vector<std::string> const & args = GetPositionalArgs();
    if (IsArgSet("-?") || IsArgSet("-h") || IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessageCli().c_str());
        return EXIT_SUCCESS;
    }
    if (args.empty()) {
        fprintf(stderr, "%s", HelpMessageCli().c_str());
        return EXIT_FAILURE;
    }

    // The walkthrough prints prose, so its log lines may go to the console too.
    if (args[0] == "demo")
        SoftSetBoolArg("-printtoconsole", true);
    fPrintToConsole = GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    fLogTimestamps = GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    InitLogging();
    OpenDebugLog();

    std::string const & command = args[0];
    if (command == "demo")
        return RunDemo();

    UniValue result;
    if (command == "generatekeys")
        result = CommandGenerateKeys();
    else if (command == "generateaddress")
        result = CommandGenerateAddress(args);
    else if (command == "scan")
        result = CommandScan(args);
    else if (command == "derivespendkey")
        result = CommandDeriveSpendKey(args);
    else if (command == "createmetadata")
        result = CommandCreateMetadata(args);
    else
        throw std::runtime_error(strprintf("Unknown command %s, see -? for usage", command));

    fprintf(stdout, "%s\n", result.write(2).c_str());
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    ECC_Start();
    std::unique_ptr<ECCVerifyHandle> globalVerifyHandle(new ECCVerifyHandle());

    int ret = EXIT_FAILURE;
    if (!ECC_InitSanityCheck()) {
        fprintf(stderr, "Elliptic curve cryptography sanity check failure. Aborting.\n");
    } else {
        try {
            ret = AppInitCli(argc, argv);
        } catch (const StealthError& e) {
            fprintf(stderr, "error: %s (%s)\n", e.what(), StealthErrorName(e.GetCode()).c_str());
        } catch (const std::exception& e) {
            PrintExceptionContinue(&e, "AppInitCli()");
            fprintf(stderr, "error: %s\n", e.what());
        }
    }

    globalVerifyHandle.reset();
    ECC_Stop();
    return ret;
}
