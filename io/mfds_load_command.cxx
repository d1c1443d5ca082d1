#include "mfds_load_command.h"
#include "mfds_common.h"

#include <algorithm>
#include <ostream>

namespace
{
// **************************************************************************
int count_differences(const mfds_command_keys &a, const mfds_command_keys &b,
    std::string &dim)
{
    if ((a.infile.size() != b.infile.size()) ||
        (a.memory.size() != b.memory.size()))
        return -1;

    int n_diff = 0;
    mfds_keyring::const_iterator it = a.memory.begin();
    mfds_keyring::const_iterator end = a.memory.end();
    for (; it != end; ++it)
    {
        const mfds_key *mem_b = b.memory.find(it->first);
        const mfds_key *in_a = a.infile.find(it->first);
        const mfds_key *in_b = b.infile.find(it->first);

        if (!mem_b || (!in_a != !in_b))
            return -1;

        if ((it->second != *mem_b) || (in_a && (*in_a != *in_b)))
        {
            dim = it->first;
            ++n_diff;
        }
    }

    return n_diff;
}

// **************************************************************************
bool is_ascending(const std::vector<long> &l)
{
    size_t n = l.size();
    for (size_t i = 1; i < n; ++i)
    {
        if (l[i] < l[i-1])
            return false;
    }
    return true;
}

// **************************************************************************
std::vector<long> permute(const std::vector<long> &l,
    const std::vector<size_t> &order)
{
    size_t n = order.size();
    std::vector<long> out(n);
    for (size_t i = 0; i < n; ++i)
        out[i] = l[order[i]];
    return out;
}
}

// --------------------------------------------------------------------------
int mfds_load_command::merge()
{
    bool changed = true;
    while (changed)
    {
        changed = false;

        size_t n = m_keys.size();
        for (size_t i = 0; (i < n) && !changed; ++i)
        {
            for (size_t j = i + 1; (j < n) && !changed; ++j)
            {
                std::string dim;
                int n_diff = count_differences(m_keys[i], m_keys[j], dim);

                if (n_diff == 0)
                {
                    // the same elements twice
                    m_keys.erase(m_keys.begin() + j);
                    changed = true;
                }
                else if (n_diff == 1)
                {
                    mfds_key *in_i = m_keys[i].infile.find(dim);
                    mfds_key *in_j = m_keys[j].infile.find(dim);
                    mfds_key *mem_i = m_keys[i].memory.find(dim);
                    mfds_key *mem_j = m_keys[j].memory.find(dim);

                    // dimensions absent from the file can not be merged
                    if ((in_i && (in_i->is_none() || in_j->is_none()))
                        || mem_i->is_none() || mem_j->is_none())
                        continue;

                    mfds_key mem;
                    if (mem_i->append(*mem_j, mem))
                        return -1;

                    if (in_i)
                    {
                        mfds_key in;
                        if (in_i->append(*in_j, in))
                            return -1;
                        *in_i = in;
                    }

                    *mem_i = mem;

                    m_keys.erase(m_keys.begin() + j);
                    changed = true;
                }
            }
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
void mfds_load_command::simplify()
{
    size_t n = m_keys.size();
    for (size_t i = 0; i < n; ++i)
    {
        mfds_keyring &infile = m_keys[i].infile;
        mfds_keyring &memory = m_keys[i].memory;

        memory.make_list_int();
        infile.make_list_int();

        mfds_keyring::iterator it = infile.begin();
        mfds_keyring::iterator end = infile.end();
        for (; it != end; ++it)
        {
            mfds_key &in = it->second;
            mfds_key *mem = memory.find(it->first);

            if (!in.is_list() || in.is_str() || is_ascending(in.get_list()))
                continue;

            // read the file forward, memory takes the matching order
            const std::vector<long> &in_ids = in.get_list();
            std::vector<size_t> order(in_ids.size());
            for (size_t j = 0; j < order.size(); ++j)
                order[j] = j;

            std::stable_sort(order.begin(), order.end(),
                [&in_ids](size_t a, size_t b) { return in_ids[a] < in_ids[b]; });

            if (mem && mem->is_list() && !mem->is_str() &&
                (mem->get_list().size() == in_ids.size()))
            {
                mfds_key sorted_mem(permute(mem->get_list(), order));
                sorted_mem.set_parent_size(mem->get_parent_size());
                *mem = sorted_mem;
            }

            mfds_key sorted_in(permute(in_ids, order));
            sorted_in.set_parent_size(in.get_parent_size());
            in = sorted_in;
        }

        infile.simplify();
        memory.simplify();
    }
}

// --------------------------------------------------------------------------
void mfds_load_command::sort_by(const std::vector<std::string> &dims)
{
    size_t n = m_keys.size();
    for (size_t i = 0; i < n; ++i)
    {
        m_keys[i].infile.sort_by(dims);
        m_keys[i].memory.sort_by(dims);
    }
}

// --------------------------------------------------------------------------
int mfds_load_command::separate_variables(const std::string &var_dim,
    std::vector<mfds_load_command> &commands) const
{
    std::vector<std::string> var_names;
    std::vector<mfds_load_command> per_var;

    size_t n = m_keys.size();
    for (size_t i = 0; i < n; ++i)
    {
        const mfds_command_keys &keys = m_keys[i];

        const mfds_key *in_var = keys.infile.find(var_dim);
        const mfds_key *mem_var = keys.memory.find(var_dim);
        if (!in_var || !mem_var)
        {
            // no variable dimension, nothing to separate
            commands.push_back(*this);
            return 0;
        }

        const std::vector<std::string> &names = in_var->get_names();

        std::vector<long> mem_ids;
        mfds_key tmp(*mem_var);
        if (!in_var->is_str() || tmp.to_list(mem_ids)
            || (mem_ids.size() != names.size()))
        {
            MFDS_ERROR("Invalid variable keys " << *in_var << " -> "
                << *mem_var << " for \"" << m_filename << "\"")
            return -1;
        }

        size_t n_names = names.size();
        for (size_t j = 0; j < n_names; ++j)
        {
            mfds_command_keys var_keys(keys);
            var_keys.infile.set(var_dim, mfds_key::from_name(names[j]));
            var_keys.memory.set(var_dim, mfds_key(mem_ids[j]));

            std::vector<std::string>::iterator it =
                std::find(var_names.begin(), var_names.end(), names[j]);

            if (it == var_names.end())
            {
                var_names.push_back(names[j]);
                per_var.push_back(mfds_load_command(m_filename));
                per_var.back().add_keys(var_keys);
            }
            else
            {
                per_var[it - var_names.begin()].add_keys(var_keys);
            }
        }
    }

    commands.insert(commands.end(), per_var.begin(), per_var.end());
    return 0;
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const mfds_load_command &cmd)
{
    os << cmd.get_filename();
    size_t n = cmd.size();
    for (size_t i = 0; i < n; ++i)
    {
        const mfds_command_keys &keys = cmd.get_keys(i);
        os << std::endl << "    " << keys.infile << " -> " << keys.memory;
    }
    return os;
}
