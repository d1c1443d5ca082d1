#ifndef mfds_binary_stream_h
#define mfds_binary_stream_h

/// @file

#include "mfds_config.h"
#include "mfds_mpi.h"

#include <cstring>
#include <string>
#include <vector>

/** @brief
 * A byte buffer holding the serialized state of keys, coordinates, scans
 * and configurations.
 *
 * @details
 * Values are appended with pack and read back in the same order with
 * unpack. Reads past the end leave the value untouched and put the stream
 * in a failed state, tested with good. Containers are written as their
 * length followed by their elements. broadcast ships the bytes of rank 0 to
 * the other ranks, this is how a configuration parsed once reaches every
 * rank.
 */
class MFDS_EXPORT mfds_binary_stream
{
public:
    mfds_binary_stream() : m_read(0), m_fail(false) {}

    /// true when the stream holds bytes
    operator bool() const { return !m_data.empty(); }

    /// false once a read went past the end
    bool good() const { return !m_fail; }

    /// forget the bytes and the read position
    void clear();

    /// read again from the first byte
    void rewind() { m_read = 0; m_fail = false; }

    unsigned long size() const { return m_data.size(); }
    const unsigned char *get_data() const { return m_data.data(); }

    void swap(mfds_binary_stream &other);

    /// returns true if the two streams hold the same bytes
    bool operator==(const mfds_binary_stream &other) const
    { return m_data == other.m_data; }

    template <typename T> void pack(const T &val)
    { this->write(&val, sizeof(T)); }

    template <typename T> void unpack(T &val)
    { this->read(&val, sizeof(T)); }

    template <typename T> void pack(const T *vals, unsigned long n)
    { this->write(vals, n*sizeof(T)); }

    template <typename T> void unpack(T *vals, unsigned long n)
    { this->read(vals, n*sizeof(T)); }

    void pack(const std::string &str);
    void unpack(std::string &str);

    void pack(const std::vector<std::string> &v);
    void unpack(std::vector<std::string> &v);

    /// per file captures of the scans
    void pack(const std::vector<std::vector<std::string>> &v);
    void unpack(std::vector<std::vector<std::string>> &v);

    template <typename T> void pack(const std::vector<T> &v);
    template <typename T> void unpack(std::vector<T> &v);

    /** read the tag written by pack(tag, strlen(tag)), no terminator.
     * returns 0 if the next bytes are the tag.
     */
    int expect(const char *tag);

    /** replace the bytes of the other ranks of comm by the bytes of
     * root_rank. returns non-zero if MPI reports an error.
     */
    int broadcast(MPI_Comm comm, int root_rank = 0);

private:
    void write(const void *src, unsigned long n);
    int read(void *dst, unsigned long n);

    // the length of a container, 0 if the stream is too short to hold it
    unsigned long read_length(unsigned long elem_size);

    std::vector<unsigned char> m_data;
    unsigned long m_read;
    bool m_fail;
};

// --------------------------------------------------------------------------
template <typename T>
void mfds_binary_stream::pack(const std::vector<T> &v)
{
    unsigned long n = v.size();
    this->pack(n);
    this->pack(v.data(), n);
}

// --------------------------------------------------------------------------
template <typename T>
void mfds_binary_stream::unpack(std::vector<T> &v)
{
    unsigned long n = this->read_length(sizeof(T));
    v.resize(n);
    this->unpack(v.data(), n);
}

#endif
