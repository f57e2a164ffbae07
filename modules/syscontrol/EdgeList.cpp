//----------------------------------------------------------------------------
//
//  EdgeList - Edge source backed by an in-memory list
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "EdgeList.h"

//----------------------------------------------------------------------------

bool EdgeList::Add(int64_t pos, bool rising)
{
    if (pos < 0)
        return false;
    if (!m_edges.empty() && pos <= m_edges.back().pos)
        return false;

    Edge e;
    e.pos = pos;
    e.rising = rising;
    m_edges.push_back(e);
    return true;
}

//----------------------------------------------------------------------------

bool EdgeList::WaitEdge(int mask, Edge *edge)
{
    while (m_next < m_edges.size())
    {
        const Edge& e = m_edges[m_next++];
        if (mask & (e.rising ? EDGE_RISING : EDGE_FALLING))
        {
            *edge = e;
            return true;
        }
    }
    return false; // end of list
}
