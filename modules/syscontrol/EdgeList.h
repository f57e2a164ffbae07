//----------------------------------------------------------------------------
//
//  EdgeList - Edge source backed by an in-memory list
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef EDGELIST_H
#define EDGELIST_H

#include "EdgeSource.h"

#include <vector>

#include <stddef.h>

class EdgeList : public EdgeSource
{
    std::vector<Edge> m_edges;
    size_t m_next = 0;        // index of next edge to deliver
    double m_sample_rate;

public:
    EdgeList(double sample_rate = 0) : m_sample_rate(sample_rate) {}

    // Append an edge. Return false, and leave the list unchanged,
    // unless pos is beyond the last edge added.
    bool Add(int64_t pos, bool rising);

    // Deliver from the beginning again
    void Rewind() { m_next = 0; }

    size_t GetCount() const { return m_edges.size(); }
    size_t GetRemaining() const { return m_edges.size() - m_next; }

    // EdgeSource interface
    double GetSampleRate() const override { return m_sample_rate; }
    bool WaitEdge(int mask, Edge *edge) override;
};

#endif
