//
//  coordinator.hpp
//  dmft-scf
//

#ifndef coordinator_hpp
#define coordinator_hpp

#include <string>
#include <vector>
#include <iostream>
#include <mpi.h>
#include "errors.hpp"
#include "gf_data_wrapper.hpp"


// Explicit coordinator/worker role. The coordinator process performs all archive I/O and all globally consistent
// decisions; every other process receives those decisions through the broadcasts below.
class Coordinator {
public:
    explicit Coordinator(const MPI_Comm& comm = MPI_COMM_WORLD, const int root = 0);

    const MPI_Comm& comm() const {return m_comm;}
    int rank() const {return m_prank;}
    int size() const {return m_psize;}
    int root() const {return m_root;}
    bool isCoordinator() const {return m_prank == m_root;}

    void barrier() const;

    void broadcast(double& x) const;
    void broadcast(int& x) const;
    void broadcast(bool& x) const;
    void broadcast(std::string& s) const;
    void broadcast(std::vector<double>& v) const;
    void broadcast(std::vector<int>& v) const;
    void broadcast(Eigen::MatrixXcd& m) const;
    void broadcast(Eigen::VectorXd& v) const;
    // Block structure is assumed identical on all processes
    void broadcast(BlockMatrix& m) const;
    void broadcast(BlockGf& g) const {g.broadcast(m_root, m_comm);}

    // Most even split of sites over processes
    void sitePartition(const Eigen::Index nsites, Eigen::Index& start, Eigen::Index& count) const;
    int siteOwner(const Eigen::Index site, const Eigen::Index nsites) const;

    // Runs fn on the coordinator only; a failure there is replayed with the same category and message on every process
    template <typename F>
    void broadcastStatus(F&& fn) const;
    // Runs fn on every process; a failure on any process is replayed on all, with the lowest failing rank's message
    template <typename F>
    void allStatus(F&& fn) const;

    void report(const std::string& msg) const {if (isCoordinator()) std::cout << msg << std::endl;}
    void warn(const std::string& msg) const {if (isCoordinator()) std::cout << "Warning: " << msg << std::endl;}

private:
    MPI_Comm m_comm;
    int m_psize, m_prank, m_root;
};


template <typename F>
void Coordinator::broadcastStatus(F&& fn) const {
    int code = NoError;
    std::string msg;
    if (isCoordinator()) {
        try {
            fn();
        }
        catch (const std::exception& e) {
            code = errorCode(e);
            msg = e.what();
        }
    }
    MPI_Bcast(&code, 1, MPI_INT, m_root, m_comm);
    if (code != NoError) {
        broadcast(msg);
        throwErrorCode(code, msg);
    }
}

template <typename F>
void Coordinator::allStatus(F&& fn) const {
    int code = NoError;
    std::string msg;
    try {
        fn();
    }
    catch (const std::exception& e) {
        code = errorCode(e);
        msg = e.what();
    }
    int failed = code != NoError ? m_prank : m_psize;
    MPI_Allreduce(MPI_IN_PLACE, &failed, 1, MPI_INT, MPI_MIN, m_comm);
    if (failed < m_psize) {
        MPI_Bcast(&code, 1, MPI_INT, failed, m_comm);
        int len = static_cast<int>(msg.size());
        MPI_Bcast(&len, 1, MPI_INT, failed, m_comm);
        msg.resize(len);
        MPI_Bcast(msg.data(), len, MPI_CHAR, failed, m_comm);
        throwErrorCode(code, msg);
    }
}

#endif /* coordinator_hpp */
