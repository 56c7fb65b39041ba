//
//  coordinator.cpp
//  dmft-scf
//

#include <cstring>
#include "coordinator.hpp"


Coordinator::Coordinator(const MPI_Comm& comm, const int root) : m_comm(comm), m_root(root) {
    MPI_Comm_size(comm, &m_psize);
    MPI_Comm_rank(comm, &m_prank);
    if (root < 0 || root >= m_psize) throw std::invalid_argument("Coordinator rank is out of the communicator range!");
}

void Coordinator::barrier() const {
    MPI_Barrier(m_comm);
}

void Coordinator::broadcast(double& x) const {
    MPI_Bcast(&x, 1, MPI_DOUBLE, m_root, m_comm);
}

void Coordinator::broadcast(int& x) const {
    MPI_Bcast(&x, 1, MPI_INT, m_root, m_comm);
}

void Coordinator::broadcast(bool& x) const {
    MPI_Bcast(&x, 1, MPI_CXX_BOOL, m_root, m_comm);
}

void Coordinator::broadcast(std::string& s) const {
    int l = 0;
    if (isCoordinator()) l = static_cast<int>(s.length());
    MPI_Bcast(&l, 1, MPI_INT, m_root, m_comm);
    std::vector<char> tmp(l + 1, '\0');
    if (isCoordinator()) std::strcpy(tmp.data(), s.c_str());
    MPI_Bcast(tmp.data(), l + 1, MPI_CHAR, m_root, m_comm);
    if (!isCoordinator()) s = tmp.data();
}

void Coordinator::broadcast(std::vector<double>& v) const {
    int n = 0;
    if (isCoordinator()) n = static_cast<int>(v.size());
    MPI_Bcast(&n, 1, MPI_INT, m_root, m_comm);
    v.resize(n);
    MPI_Bcast(v.data(), n, MPI_DOUBLE, m_root, m_comm);
}

void Coordinator::broadcast(std::vector<int>& v) const {
    int n = 0;
    if (isCoordinator()) n = static_cast<int>(v.size());
    MPI_Bcast(&n, 1, MPI_INT, m_root, m_comm);
    v.resize(n);
    MPI_Bcast(v.data(), n, MPI_INT, m_root, m_comm);
}

void Coordinator::broadcast(Eigen::MatrixXcd& m) const {
    long dims[2] = {0, 0};
    if (isCoordinator()) {
        dims[0] = static_cast<long>(m.rows());
        dims[1] = static_cast<long>(m.cols());
    }
    MPI_Bcast(dims, 2, MPI_LONG, m_root, m_comm);
    m.resize(dims[0], dims[1]);
    MPI_Bcast(m.data(), static_cast<int>(m.size()), MPI_CXX_DOUBLE_COMPLEX, m_root, m_comm);
}

void Coordinator::broadcast(Eigen::VectorXd& v) const {
    long n = 0;
    if (isCoordinator()) n = static_cast<long>(v.size());
    MPI_Bcast(&n, 1, MPI_LONG, m_root, m_comm);
    v.resize(n);
    MPI_Bcast(v.data(), static_cast<int>(n), MPI_DOUBLE, m_root, m_comm);
}

void Coordinator::broadcast(BlockMatrix& m) const {
    for (auto& kv : m) broadcast(kv.second);
}

void Coordinator::sitePartition(const Eigen::Index nsites, Eigen::Index& start, Eigen::Index& count) const {
    mostEvenPart(nsites, m_psize, m_prank, count, start);
}

int Coordinator::siteOwner(const Eigen::Index site, const Eigen::Index nsites) const {
    Eigen::Index start, count;
    for (int p = 0; p < m_psize; ++p) {
        mostEvenPart(nsites, m_psize, p, count, start);
        if (site >= start && site < start + count) return p;
    }
    throw std::range_error("Site index is out of range!");
}
