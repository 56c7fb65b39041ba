//
//  input.hpp
//  dmft-scf
//

#ifndef input_hpp
#define input_hpp

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <optional>
#include <type_traits>
#include "pugixml.hpp"
#include "coordinator.hpp"
#include "site.hpp"


// Locate the text at path in a xml doc root. A path looks like "general/beta" for the node text or
// "lattice/hopping.file" for an attribute. Note docroot is passed by value as it is changed here.
inline bool xmlText(std::string& text, pugi::xml_node docroot, const std::string& path) {
    std::vector<std::string> pathlist;
    std::istringstream pathstream(path);
    std::string s;
    while (std::getline(pathstream, s, '/')) pathlist.push_back(s);
    if (pathlist.empty()) return false;

    for (std::size_t i = 0; i + 1 < pathlist.size(); ++i) {
        docroot = docroot.child(pathlist[i].c_str());
        if (!docroot) return false;
    }

    const std::size_t l = pathlist.back().find('.');
    if (l != std::string::npos) {
        docroot = docroot.child(pathlist.back().substr(0, l).c_str());
        if (!docroot) return false;
        const pugi::xml_attribute attr = docroot.attribute(pathlist.back().substr(l + 1).c_str());
        if (!attr) return false;
        text = attr.value();
    }
    else {
        docroot = docroot.child(pathlist.back().c_str());
        if (!docroot) return false;
        text = docroot.child_value();
    }
    return true;
}

template <typename T>
T parseValue(const std::string& text, const std::string& path) {
    try {
        if constexpr (std::is_same<T, std::string>::value) return text;
        else if constexpr (std::is_same<T, bool>::value) {
            if (text == "true" || text == "True" || text == "1") return true;
            else if (text == "false" || text == "False" || text == "0") return false;
            else throw std::invalid_argument(text);
        }
        else if constexpr (std::is_same<T, int>::value) return std::stoi(text);
        else if constexpr (std::is_same<T, long>::value) return std::stol(text);
        else if constexpr (std::is_same<T, double>::value) return std::stod(text);
        else static_assert(std::is_same<T, double>::value, "parseValue: input data type not implemented currently");
    }
    catch (const std::logic_error&) {
        throw ConfigurationError("Cannot interpret \"" + text + "\" given for " + path);
    }
}

// Whitespace or comma separated list
template <typename T>
std::vector<T> parseList(const std::string& text, const std::string& path) {
    std::string normalized(text);
    for (char& c : normalized) if (c == ',' || c == ';') c = ' ';
    std::istringstream ss(normalized);
    std::vector<T> values;
    std::string word;
    while (ss >> word) values.push_back(parseValue<T>(word, path));
    return values;
}

// Read from a xml doc root the data located at path; data keeps its default if the node is absent
template <typename T>
bool readxml(T& data, const pugi::xml_node& docroot, const std::string& path) {
    std::string text;
    if (!xmlText(text, docroot, path)) {
        std::cout << "No " << path << " specified, using default " << data << std::endl;
        return false;
    }
    data = parseValue<T>(text, path);
    std::cout << "Input " << path << " is " << data << std::endl;
    return true;
}

// Read on the coordinator and broadcast to every process. Only the coordinator needs a loaded document.
template <typename T>
bool readxml_bcast(T& data, const pugi::xml_node& docroot, const std::string& path, const Coordinator& coord, const double unit = -1.0) {
    bool readed = false;
    coord.broadcastStatus([&]() {readed = readxml(data, docroot, path);});
    coord.broadcast(readed);
    if (!readed) return false;

    if constexpr (std::is_same<T, std::string>::value) coord.broadcast(data);
    else if constexpr (std::is_same<T, int>::value || std::is_same<T, bool>::value) coord.broadcast(data);
    else if constexpr (std::is_same<T, long>::value) MPI_Bcast(&data, 1, MPI_LONG, coord.root(), coord.comm());
    else if constexpr (std::is_same<T, double>::value) {
        coord.broadcast(data);
        if (unit > 0) data /= unit;
    }
    else static_assert(std::is_same<T, double>::value, "readxml_bcast: input data type not implemented currently");
    return true;
}

// Optional scalar: stays empty when the node is absent
template <typename T>
bool readxml_bcast(std::optional<T>& data, const pugi::xml_node& docroot, const std::string& path, const Coordinator& coord) {
    T value{};
    const bool readed = readxml_bcast(value, docroot, path, coord);
    if (readed) data = value;
    return readed;
}

// List of values, e.g., per-site parameters or k-grid sizes
template <typename T>
bool readxml_bcast(std::vector<T>& data, const pugi::xml_node& docroot, const std::string& path, const Coordinator& coord) {
    std::string text;
    if (!readxml_bcast(text, docroot, path, coord)) return false;
    data = parseList<T>(text, path);
    return true;
}

template <typename T>
bool readxml_bcast(PerSite<T>& data, const pugi::xml_node& docroot, const std::string& path, const Coordinator& coord) {
    std::vector<T> values;
    if (!readxml_bcast(values, docroot, path, coord)) return false;
    if (values.empty()) throw ConfigurationError("Parameter " + path + " is given but empty");
    data = PerSite<T>::list(values);
    return true;
}

#endif /* input_hpp */
