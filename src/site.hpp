//
//  site.hpp
//  dmft-scf
//

#ifndef site_hpp
#define site_hpp

#include <string>
#include <vector>
#include <Eigen/Core>
#include "errors.hpp"


enum class SolverKind : int {Sampling = 0, Hartree = 1};

inline SolverKind solverKindFromString(const std::string& s) {
    if (s == "sampling") return SolverKind::Sampling;
    else if (s == "hartree") return SolverKind::Hartree;
    else throw ConfigurationError("Unknown impurity solver type " + s + "; allowed types are sampling and hartree");
}

inline std::string solverKindName(const SolverKind kind) {
    return kind == SolverKind::Hartree ? "hartree" : "sampling";
}

// Inequivalent correlated site. norb counts orbitals without spin.
struct Site {
    int index = 0;
    Eigen::Index norb = 1;
    Eigen::Index multiplicity = 1;
    SolverKind solver = SolverKind::Sampling;
    double U = 0.0;
    double J = 0.0;
};


// Parameter given either once for all sites or once per site
template <typename T>
class PerSite {
public:
    PerSite() = default;
    explicit PerSite(const T& v) : m_values(1, v) {}
    explicit PerSite(const std::vector<T>& vs) : m_values(vs) {}

    static PerSite single(const T& v) {return PerSite(v);}
    static PerSite list(const std::vector<T>& vs) {return PerSite(vs);}

    bool empty() const {return m_values.empty();}
    std::size_t size() const {return m_values.size();}
    const std::vector<T>& raw() const {return m_values;}

    // Validated once at setup; a single value is repeated for every site
    std::vector<T> expand(const Eigen::Index nsites, const std::string& name) const {
        if (m_values.size() == 1) return std::vector<T>(nsites, m_values[0]);
        if (static_cast<Eigen::Index>(m_values.size()) != nsites)
            throw ConfigurationError("Parameter " + name + " has " + std::to_string(m_values.size()) + " entries but there are "
                                     + std::to_string(nsites) + " inequivalent sites");
        return m_values;
    }

private:
    std::vector<T> m_values;
};

#endif /* site_hpp */
