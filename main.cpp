#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "civdoc/applicant_data.h"

// civdoc_tool: inspect applicant documents from the command line.
//
//   civdoc_tool eval  <doc.json> <jsonpath>   prints true / false
//   civdoc_tool merge <a.json> <b.json>       prints the merged document, then
//                                             one "conflict: <path>" per line
//   civdoc_tool read  <doc.json> <path>       prints the value at path

namespace {

void usage(const char* argv0)
{
    std::cerr << "usage:\n"
              << "  " << argv0 << " eval  <doc.json> <jsonpath>\n"
              << "  " << argv0 << " merge <a.json> <b.json>\n"
              << "  " << argv0 << " read  <doc.json> <path>\n";
}

std::string read_file(const std::string& filename)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + filename);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

int run_eval(const std::string& doc_file, const std::string& query)
{
    civdoc::ApplicantData data(read_file(doc_file));
    bool hit = data.eval_predicate(civdoc::JsonPathPredicate::create(query));
    std::cout << (hit ? "true" : "false") << "\n";
    return 0;
}

int run_merge(const std::string& base_file, const std::string& incoming_file)
{
    civdoc::ApplicantData base(read_file(base_file));
    civdoc::ApplicantData incoming(read_file(incoming_file));
    std::vector<civdoc::Path> conflicts = base.merge_from(incoming);
    std::cout << base.as_json_string() << "\n";
    for (const auto& path : conflicts) {
        std::cout << "conflict: " << path.to_string() << "\n";
    }
    return 0;
}

int run_read(const std::string& doc_file, const std::string& path)
{
    civdoc::ApplicantData data(read_file(doc_file));
    std::optional<std::string> value = data.read_as_string(civdoc::Path::create(path));
    if (value) {
        std::cout << *value << "\n";
    } else {
        LOG(INFO) << "No string or integer list at " << path;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    if (argc != 4) {
        usage(argv[0]);
        return 1;
    }
    const std::string command = argv[1];

    try {
        if (command == "eval")  return run_eval(argv[2], argv[3]);
        if (command == "merge") return run_merge(argv[2], argv[3]);
        if (command == "read")  return run_read(argv[2], argv[3]);
    } catch (const std::exception& e) {
        LOG(ERROR) << command << " failed: " << e.what();
        return 1;
    }

    usage(argv[0]);
    return 1;
}
