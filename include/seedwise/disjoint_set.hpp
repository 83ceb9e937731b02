#ifndef SEEDWISE_DISJOINT_SET_HEADER
#define SEEDWISE_DISJOINT_SET_HEADER

#include <vector>

namespace seedwise {

/**
 * Union-find over the indices [0, n) of some arena (here, a record list). Using
 * indices instead of links between the records themselves means no record ever
 * points at another, so there is nothing to keep consistent when records come and go
 * between runs.
 *
 * Unions always attach the set with the larger root under the one with the smaller
 * root, so the root of every set is its smallest element regardless of the order of
 * the unions.
 */
class disjoint_set
{
    std::vector<int> parents_;

public:

    explicit disjoint_set(const int n) : parents_(n)
    {
        for(int i = 0; i < n; ++i) { parents_[i] = i; }
    }

    int size() const noexcept { return parents_.size(); }

    int find(int i)
    {
        while(parents_[i] != i)
        {
            // path halving
            parents_[i] = parents_[parents_[i]];
            i = parents_[i];
        }
        return i;
    }

    void unite(const int a, const int b)
    {
        const int root_a = find(a);
        const int root_b = find(b);
        if(root_a < root_b)
            parents_[root_b] = root_a;
        else if(root_b < root_a)
            parents_[root_a] = root_b;
    }

    bool same_set(const int a, const int b) { return find(a) == find(b); }
};

} // namespace seedwise

#endif // SEEDWISE_DISJOINT_SET_HEADER
